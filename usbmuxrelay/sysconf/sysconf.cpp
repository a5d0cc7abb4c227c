//
//  sysconf.cpp
//  usbmuxrelay
//

#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include "sysconf.hpp"
#include "../MuxAddress.hpp"
#include "../DeviceFinder.hpp"
#include <libgeneral/macros.h>

#define CONFIG_SOCKET_ADDRESS_KEY           "SocketAddress"
#define CONFIG_PROG_NAME_KEY                "ProgName"
#define CONFIG_CLIENT_VERSION_STRING_KEY    "ClientVersionString"
#define CONFIG_DISCOVERY_TIMEOUT_KEY        "DiscoveryTimeout"
#define CONFIG_LOG_LEVEL_KEY                "LogLevel"

static plist_t readPlist(const char *filePath){
    int fd = -1;
    char *fbuf = NULL;
    cleanup([&]{
        safeFree(fbuf);
        safeClose(fd);
    });
    struct stat finfo = {};

    retassure((fd = open(filePath, O_RDONLY))>=0, "Failed to read plist at path '%s'",filePath);
    assure(!fstat(fd, &finfo));
    retassure(finfo.st_size > 0, "Empty plist at path '%s'",filePath);

    assure(fbuf = (char*)malloc(finfo.st_size));

    assure(read(fd, fbuf, finfo.st_size) == finfo.st_size);

    {
        plist_t pl = NULL;
        plist_from_memory(fbuf, (uint32_t)finfo.st_size, &pl, NULL);
        retassure(pl, "failed to parse plist at path '%s'",filePath);
        return pl;
    }
}

static uint16_t parse_port(const std::string &str){
    unsigned long port = 0;
    char *endp = NULL;
    retassure(str.size(), "Empty port number");
    port = strtoul(str.c_str(), &endp, 10);
    retassure(*endp == '\0' && port <= 0xffff, "Bad port number '%s'",str.c_str());
    return (uint16_t)port;
}

RelayMapping sysconf_parse_mapping(const std::string &str){
    size_t colonPos = str.find(':');
    RelayMapping ret{};
    retassure(colonPos != std::string::npos, "Mapping '%s' is not of the form devicePort:localPort",str.c_str());
    ret.devicePort = parse_port(str.substr(0,colonPos));
    ret.localPort = parse_port(str.substr(colonPos+1));
    retassure(ret.devicePort, "Device port must not be 0 in mapping '%s'",str.c_str());
    return ret;
}

#pragma mark config
static std::string sysconf_try_getconfig_string(plist_t p_config, const char *key, const std::string &defaultValue){
    plist_t p_str = NULL;
    const char *str = NULL;
    uint64_t str_len = 0;
    if (!(p_str = plist_dict_get_item(p_config, key))) return defaultValue;
    if (plist_get_node_type(p_str) != PLIST_STRING || !(str = plist_get_string_ptr(p_str, &str_len))) {
        warning("Config value for %s is not a string, ignoring",key);
        return defaultValue;
    }
    return std::string(str,str_len);
}

static uint64_t sysconf_try_getconfig_uint(plist_t p_config, const char *key, uint64_t defaultValue){
    plist_t p_uint = NULL;
    uint64_t ret = defaultValue;
    if (!(p_uint = plist_dict_get_item(p_config, key))) return defaultValue;
    if (plist_get_node_type(p_uint) != PLIST_UINT) {
        warning("Config value for %s is not an integer, ignoring",key);
        return defaultValue;
    }
    plist_get_uint_val(p_uint, &ret);
    return ret;
}

Config::Config() :
//config
socketAddress(USBMUXD_SOCKET_PATH),
progName(PACKAGE_NAME),
clientVersionString(PACKAGE_NAME "-" VERSION_STRING),
discoveryTimeout(DEFAULT_DISCOVERY_TIMEOUT_MS),
logLevel(-1),
//commandline
configFile(DEFAULT_CONFIG_FILE),
useLogfile(false),
verbose(0)
{
    //empty
}

void Config::load(){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });
    struct stat st{};

    if (stat(configFile.c_str(), &st) && errno == ENOENT) {
        info("No config at %s, using defaults",configFile.c_str());
        return;
    }
    p_config = readPlist(configFile.c_str());
    retassure(plist_get_node_type(p_config) == PLIST_DICT, "Config at '%s' is not a dictionary",configFile.c_str());
    load(p_config);
    info("Loaded config from %s",configFile.c_str());
}

void Config::load(plist_t p_config){
    uint64_t val = 0;
    socketAddress = sysconf_try_getconfig_string(p_config, CONFIG_SOCKET_ADDRESS_KEY, socketAddress);
    progName = sysconf_try_getconfig_string(p_config, CONFIG_PROG_NAME_KEY, progName);
    clientVersionString = sysconf_try_getconfig_string(p_config, CONFIG_CLIENT_VERSION_STRING_KEY, clientVersionString);

    val = sysconf_try_getconfig_uint(p_config, CONFIG_DISCOVERY_TIMEOUT_KEY, discoveryTimeout);
    if (val == 0 || val > UINT32_MAX) {
        warning("Config value for %s out of range, ignoring",CONFIG_DISCOVERY_TIMEOUT_KEY);
    } else {
        discoveryTimeout = (uint32_t)val;
    }

    if (plist_dict_get_item(p_config, CONFIG_LOG_LEVEL_KEY)) {
        val = sysconf_try_getconfig_uint(p_config, CONFIG_LOG_LEVEL_KEY, UINT64_MAX);
        if (val != UINT64_MAX) {
            if (val > LL_DEBUG) val = LL_DEBUG;
            logLevel = (int)val;
        }
    }
}
