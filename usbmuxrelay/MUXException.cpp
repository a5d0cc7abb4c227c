//
//  MUXException.cpp
//  usbmuxrelay
//

#include "MUXException.hpp"
#include "usbmuxrelay-proto.h"
#include <libgeneral/macros.h>

namespace tihmstar {

const char *result_description(uint32_t result) noexcept{
    switch (result) {
        case RESULT_BADDEV:
            return ": Device isn't connected";
        case RESULT_CONNREFUSED:
            return ": Port isn't available or open";
        case RESULT_MALFORMED:
            return ": Malformed request";
        default:
            return "";
    }
}

void throw_result_error(const char *what, uint32_t result){
    try {
        retcustomerror(MUXException_result, "%s, Err #%u%s", what, result, result_description(result));
    } catch (tihmstar::MUXException_result &e) {
        e._result = result;
        throw;
    }
}

};
