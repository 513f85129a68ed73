/**
 * @file cli_options.cpp
 * @brief Command line parsing with Boost.Program_options
 */
#include "cli_options.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"

#include <boost/program_options.hpp>

#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace certstalker::app {

namespace {

po::options_description buildOptions() {
    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show help message")
        ("domain,d", po::value<std::string>(), "Domain to enumerate")
        ("domain-file,D", po::value<std::string>(), "File with one domain per line")
        ("output,o", po::value<std::string>(),
         "Output JSON file (\"{domain}\" is replaced by the domain)")
        ("format,f", po::value<int>(), "Output format: 1 = detailed, 2 = endpoints only")
        ("check-live", "Probe discovered hostnames for reachability")
        ("ports,p", po::value<std::string>(),
         "Extra ports to probe, comma-separated (added to 443,80,8443)")
        ("user-agent", po::value<std::string>(), "User-Agent for provider requests and probes")
        ("proxy", po::value<std::string>(), "HTTP proxy for probes (http://host:port)")
        ("keys-file", po::value<std::string>(), "JSON file with API keys per provider")
        ("rate-limit", po::value<double>(), "Probe rate limit in requests per second (0 = unlimited)")
        ("workers", po::value<int>(), "Concurrent liveness probes (default 20)")
        ("timeout", po::value<int>(), "Probe timeout in seconds (default 5)")
        ("run-timeout", po::value<int>(), "Whole-run timeout per domain in seconds (0 = none)")
        ("debug", "Verbose logging; keep unreachable endpoints in endpoints-only output")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error or critical")
        ("log-file", po::value<std::string>(), "Also log to this rotating file");
    return options;
}

} // anonymous namespace

CliOptions parseCommandLine(int argc, const char* const argv[]) {
    CliOptions cli;
    po::options_description options = buildOptions();

    std::ostringstream usage;
    usage << "Usage: certstalker (-d <domain> | -D <file>) -o <output.json> -f <1|2> [OPTIONS]\n\n"
          << options;
    cli.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw common::ConfigException(e.what());
    }

    if (vm.count("help")) {
        cli.showHelp = true;
        return cli;
    }

    common::Config& config = cli.config;
    config.loadFromEnv();

    if (vm.count("domain") && vm.count("domain-file")) {
        throw common::ConfigException("--domain and --domain-file are mutually exclusive");
    }
    if (vm.count("domain")) {
        config.domains.push_back(vm["domain"].as<std::string>());
    } else if (vm.count("domain-file")) {
        config.domains = loadDomainFile(vm["domain-file"].as<std::string>());
    } else {
        throw common::ConfigException("one of --domain or --domain-file is required");
    }

    if (!vm.count("output")) {
        throw common::ConfigException("--output is required");
    }
    config.outputPath = vm["output"].as<std::string>();

    if (!vm.count("format")) {
        throw common::ConfigException("--format is required");
    }
    int format = vm["format"].as<int>();
    if (format != 1 && format != 2) {
        throw common::ConfigException("--format must be 1 (detailed) or 2 (endpoints only)");
    }
    config.outputFormat = static_cast<common::OutputFormat>(format);

    config.checkLiveness = vm.count("check-live") > 0;
    config.debug = vm.count("debug") > 0;

    if (vm.count("ports")) config.extraPorts = common::parsePortList(vm["ports"].as<std::string>());
    if (vm.count("user-agent")) config.userAgent = vm["user-agent"].as<std::string>();
    if (vm.count("proxy")) config.proxyUrl = vm["proxy"].as<std::string>();
    if (vm.count("rate-limit")) config.probeRateLimit = vm["rate-limit"].as<double>();
    if (vm.count("workers")) config.probeWorkers = vm["workers"].as<int>();
    if (vm.count("timeout")) config.probeTimeoutSeconds = vm["timeout"].as<int>();
    if (vm.count("run-timeout")) config.runTimeoutSeconds = vm["run-timeout"].as<int>();
    if (vm.count("log-level")) config.logLevel = vm["log-level"].as<std::string>();
    if (vm.count("log-file")) config.logFile = vm["log-file"].as<std::string>();

    if (vm.count("keys-file")) {
        config.loadKeysFile(vm["keys-file"].as<std::string>());
    }

    config.validate();
    return cli;
}

std::vector<std::string> loadDomainFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw common::ConfigException("cannot open domain file " + path);
    }

    std::vector<std::string> domains;
    std::string line;
    while (std::getline(in, line)) {
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        domains.push_back(line);
    }

    if (domains.empty()) {
        throw common::ConfigException("domain file " + path + " contains no domain");
    }
    return domains;
}

std::string outputPathFor(const std::string& pattern, const std::string& domain, size_t domainCount) {
    static const std::string placeholder = "{domain}";

    std::string path = pattern;
    size_t pos = path.find(placeholder);
    if (pos != std::string::npos) {
        while (pos != std::string::npos) {
            path.replace(pos, placeholder.size(), domain);
            pos = path.find(placeholder, pos + domain.size());
        }
        return path;
    }

    if (domainCount <= 1) {
        return path;
    }

    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return domain + "_" + path;
    }
    return path.substr(0, slash + 1) + domain + "_" + path.substr(slash + 1);
}

} // namespace certstalker::app
