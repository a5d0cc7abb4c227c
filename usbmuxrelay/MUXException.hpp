//
//  MUXException.hpp
//  usbmuxrelay
//

#ifndef MUXException_hpp
#define MUXException_hpp

#include <libgeneral/exception.hpp>
#include <stdint.h>

namespace tihmstar {

class MUXException : public tihmstar::exception {
public:
    using tihmstar::exception::exception;
};

#pragma mark custom catch exceptions
/*
 daemon answered a request with a non-zero Result
 */
class MUXException_result : public MUXException{
    uint32_t _result = 0;
public:
    using MUXException::MUXException;

    uint32_t result() const noexcept {return _result;}

    friend void throw_result_error(const char *what, uint32_t result);
};

/*
 no (matching) device is attached
 */
class MUXException_no_device : public MUXException{
public:
    using MUXException::MUXException;
};

class MUXException_disconnected : public MUXException{
public:
    using MUXException::MUXException;
};

const char *result_description(uint32_t result) noexcept;

[[noreturn]] void throw_result_error(const char *what, uint32_t result);

};

#endif /* MUXException_hpp */
