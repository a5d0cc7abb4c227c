//
//  main.cpp
//  usbmuxrelay
//

#include "Relay.hpp"
#include "Protocol.hpp"
#include "MUXException.hpp"
#include "sysconf/sysconf.hpp"

#include <libgeneral/macros.h>
#include <libgeneral/Event.hpp>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>
#include <errno.h>
#include <stdio.h>

#undef error //errors will be printed as fatal for this file
#define error(a ...) usbmuxrelay_log(LL_FATAL,a)

static tihmstar::Event terminateEvent;
static Config *gConfig = nullptr;
static std::string cliSocketAddress;
static uint32_t cliTimeout = 0;
static bool quiet = false;

class LogRelayDelegate : public RelayDelegate{
    uint16_t _devicePort;
    uint16_t _localPort;
public:
    LogRelayDelegate(const RelayMapping &m) : _devicePort(m.devicePort), _localPort(m.localPort) {}

    void setLocalPort(uint16_t port){_localPort = port;}

    virtual void relay_ready(const std::string &udid) override{
        notice("[%u->%u] ready, using device %s",_localPort,_devicePort,udid.c_str());
    }
    virtual void relay_warning(const tihmstar::exception &e) override{
        warning("[%u->%u] %s",_localPort,_devicePort,e.what());
    }
    virtual void relay_attached(const std::string &udid) override{
        notice("[%u->%u] device attached %s",_localPort,_devicePort,udid.c_str());
    }
    virtual void relay_detached(const std::string &udid) override{
        notice("[%u->%u] device detached %s",_localPort,_devicePort,udid.c_str());
    }
    virtual void relay_error(const tihmstar::exception &e) override{
        usbmuxrelay_log(LL_ERROR, "[%u->%u] %s",_localPort,_devicePort,e.what());
    }
    virtual void relay_connect() override{
        info("[%u->%u] connection opened",_localPort,_devicePort);
    }
    virtual void relay_disconnect() override{
        info("[%u->%u] connection closed",_localPort,_devicePort);
    }
    virtual void relay_close() override{
        notice("[%u->%u] relay closed",_localPort,_devicePort);
    }
};

static void handle_signal(int sig) noexcept{
    static int ctrlcCounter = 0;
    info("Caught signal %d, exiting", sig);
    if (ctrlcCounter++ == 5){
        fatal("forcefully terminating program!");
        exit(2);
    }
    terminateEvent.notifyAll();
}

static void set_signal_handlers(void){
    assure(signal(SIGINT, handle_signal)  != SIG_ERR);
    assure(signal(SIGQUIT, handle_signal) != SIG_ERR);
    assure(signal(SIGTERM, handle_signal) != SIG_ERR);

    assure(signal(SIGPIPE, SIG_IGN) != SIG_ERR);
}

static void usage(){
    printf("Usage: %s [OPTIONS] DEVICE_PORT:LOCAL_PORT [DEVICE_PORT:LOCAL_PORT ...]\n", PACKAGE_NAME);
    printf("Forward local TCP ports to ports on an iOS device through usbmuxd.\n\n");
    printf("  -h, --help\t\t\tPrint this message.\n");
    printf("  -u, --udid UDID\t\tOnly use the device with this UDID.\n");
    printf("  -t, --timeout MS\t\tWarn if no device showed up after MS milliseconds (default %u).\n", DEFAULT_DISCOVERY_TIMEOUT_MS);
    printf("  -c, --config FILE\t\tRead configuration from FILE (default %s).\n", DEFAULT_CONFIG_FILE);
    printf("  -s, --socket ADDRESS\t\tusbmuxd address, UNIX:/path or host:port (default %s).\n", USBMUXD_SOCKET_PATH);
    printf("  -l, --logfile=LOGFILE\t\tLog (append) to LOGFILE instead of stderr.\n");
    printf("  -v, --verbose\t\t\tBe verbose (use twice or more to increase).\n");
    printf("  -q, --quiet\t\t\tOnly print errors.\n");
    printf("  -V, --version\t\t\tPrint version information and exit.\n");
    printf("\n");
    printf("%s overrides the usbmuxd address.\n", USBMUXD_SOCKET_ADDRESS_ENV);
    printf("\n");
}

static void parse_opts(int argc, const char **argv){
    static struct option longopts[] = {
        {"help",                    no_argument,        NULL, 'h'},
        {"udid",                    required_argument,  NULL, 'u'},
        {"timeout",                 required_argument,  NULL, 't'},
        {"config",                  required_argument,  NULL, 'c'},
        {"socket",                  required_argument,  NULL, 's'},
        {"logfile",                 required_argument,  NULL, 'l'},
        {"verbose",                 no_argument,        NULL, 'v'},
        {"quiet",                   no_argument,        NULL, 'q'},
        {"version",                 no_argument,        NULL, 'V'},
        {NULL,                      0,                  NULL,  0 }
    };
    int optindex = 0;
    int opt = 0;

    while ((opt = getopt_long(argc, (char* const *)argv, "hu:t:c:s:l:vqV", longopts, &optindex)) >= 0) {
        switch (opt) {
            case 'h':
                usage();
                exit(0);
                break;
            case 'u':
                gConfig->udid = optarg;
                break;
            case 't':
            {
                char *endp = NULL;
                unsigned long timeout = strtoul(optarg, &endp, 10);
                if (*endp || !timeout || timeout > UINT32_MAX) {
                    fatal("ERROR: --timeout requires a positive number of milliseconds");
                    exit(2);
                }
                cliTimeout = (uint32_t)timeout;
            }
                break;
            case 'c':
                gConfig->configFile = optarg;
                break;
            case 's':
                cliSocketAddress = optarg;
                break;
            case 'l':
                if (!*optarg) {
                    fatal("ERROR: --logfile requires a non-empty filename");
                    usage();
                    exit(2);
                }
                if (gConfig->useLogfile) {
                    fatal("ERROR: --logfile cannot be used multiple times");
                    exit(2);
                }
                if (!freopen(optarg, "a", stderr)) {
                    fatal("ERROR: freopen: %s", strerror(errno));
                    exit(2);
                } else {
                    gConfig->useLogfile = true;
                }
                break;
            case 'v':
                ++gConfig->verbose;
                break;
            case 'q':
                quiet = true;
                break;
            case 'V':
                printf("%s %s\n", PACKAGE_NAME, VERSION_STRING);
                exit(0);

            default:
                usage();
                exit(2);
        }
    }

    if (optind >= argc) {
        fatal("ERROR: at least one DEVICE_PORT:LOCAL_PORT mapping is required");
        usage();
        exit(2);
    }
    for (int i = optind; i < argc; i++) {
        try {
            gConfig->mappings.push_back(sysconf_parse_mapping(argv[i]));
        } catch (tihmstar::exception &e) {
            fatal("ERROR: %s", e.what());
            exit(2);
        }
    }
}

int main(int argc, const char * argv[]) {
    int err = 0;
    std::vector<DeviceRegistry*> registries;
    std::vector<LogRelayDelegate*> delegates;
    std::vector<Relay*> relays;
    MuxAddress address;
    RelayOptions opts{};

    gConfig = new Config();
    parse_opts(argc,argv);

    try{
        gConfig->load();
    }catch(tihmstar::exception &e){
        fatal("Could not load config with error=%d (%s)",e.code(),e.what());
        creterror("failed to load config!");
    }

    // set log level to specified verbosity
    if (quiet) {
        log_level = LL_ERROR;
    } else if (gConfig->verbose) {
        log_level = LL_NOTICE + gConfig->verbose;
    } else if (gConfig->logLevel >= 0) {
        log_level = gConfig->logLevel;
    } else {
        log_level = LL_NOTICE;
    }
    info("starting %s", VERSION_STRING);

    if (cliSocketAddress.size()) gConfig->socketAddress = cliSocketAddress;
    if (cliTimeout) gConfig->discoveryTimeout = cliTimeout;

    try{
        address = MuxAddress::fromEnvironment(gConfig->socketAddress);
    }catch(tihmstar::exception &e){
        creterror("bad usbmuxd address: %s",e.what());
    }
    info("Using usbmuxd at %s",address.description().c_str());

    Protocol::setClientInfo(gConfig->progName, gConfig->clientVersionString);
    opts.timeout = gConfig->discoveryTimeout;
    opts.udid = gConfig->udid;

    try{
        set_signal_handlers();
    }catch(tihmstar::exception &e){
        creterror("failed to set signal handlers: %s",e.what());
    }

    for (auto &m : gConfig->mappings) {
        DeviceRegistry *registry = new DeviceRegistry();
        LogRelayDelegate *delegate = new LogRelayDelegate(m);
        registries.push_back(registry);
        delegates.push_back(delegate);
        try{
            Relay *relay = new Relay(*registry, address, m.devicePort, m.localPort, opts, delegate);
            delegate->setLocalPort(relay->relayPort());
            relays.push_back(relay);
        }catch(tihmstar::exception &e){
            creterror("failed to start relay %u:%u with error=%d (%s)",m.devicePort,m.localPort,e.code(),e.what());
        }
        notice("Forwarding localhost:%u to device port %u",relays.back()->relayPort(),m.devicePort);
    }

    notice("Initialization complete");

    //block thread
    terminateEvent.waitForEvent(terminateEvent.getNextEvent());

error:
    notice("main reached cleanup");
    for (auto r : relays) {
        r->stop();
    }
    for (auto r : relays) {
        delete r;
    }
    for (auto d : delegates) {
        delete d;
    }
    for (auto reg : registries) {
        delete reg;
    }
    if (gConfig){
        Config *cfg = gConfig; gConfig = nullptr;
        delete cfg;
    }
    notice("done!");
    return err;
}
