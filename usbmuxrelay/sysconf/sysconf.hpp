//
//  sysconf.hpp
//  usbmuxrelay
//

#ifndef sysconf_hpp
#define sysconf_hpp

#include <plist/plist.h>
#include <stdint.h>
#include <string>
#include <vector>

#define DEFAULT_CONFIG_FILE "/etc/usbmuxrelay.plist"

struct RelayMapping{
    uint16_t devicePort;
    uint16_t localPort;
};

/*
 parses "devicePort:localPort"
 */
RelayMapping sysconf_parse_mapping(const std::string &str);

class Config{
public:
    //config
    std::string socketAddress;
    std::string progName;
    std::string clientVersionString;
    uint32_t discoveryTimeout;
    int logLevel;

    //commandline
    std::string configFile;
    std::string udid;
    bool useLogfile;
    int verbose;
    std::vector<RelayMapping> mappings;

    Config();
    /*
     reads configFile, a missing file keeps the defaults
     */
    void load();
    void load(plist_t p_config);
};

#endif /* sysconf_hpp */
