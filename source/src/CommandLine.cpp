#include <CommandLine.hpp>
#include <Errors.hpp>
#include <Logging.hpp>

#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {

po::options_description option_list() {
    po::options_description desc("options");
    desc.add_options()
        ("help,h", "show this help")
        ("tracker,t", po::value<std::vector<std::string>>()->composing(), "tracker to use, repeatable (default: every enabled tracker)")
        ("type", po::value<std::string>(), "content type: movie, tv, boxset, music, ebook, other")
        ("category-id", po::value<unsigned>(), "explicit tracker category id (needs --type-id)")
        ("type-id", po::value<unsigned>(), "explicit tracker type id (needs --category-id)")
        ("preflight-only", "classify, resolve and check for duplicates, then stop")
        ("sync", "match the local client's torrents against the trackers' catalogs")
        ("config,c", po::value<std::string>()->default_value("config/config.json"), "configuration file")
        ("log-level", po::value<std::string>(), "trace, debug, info, warning, error, fatal");
    return desc;
}

}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    auto desc = option_list();

    po::options_description all;
    all.add(desc).add_options()("input", po::value<std::string>(), "release path");

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    CommandLine cli;
    cli.help = vm.count("help") > 0;
    if (cli.help) return cli;

    if (vm.count("input")) cli.input = vm["input"].as<std::string>();
    if (vm.count("tracker")) cli.trackers = vm["tracker"].as<std::vector<std::string>>();
    if (vm.count("category-id")) cli.category_id = vm["category-id"].as<unsigned>();
    if (vm.count("type-id")) cli.type_id = vm["type-id"].as<unsigned>();
    if (vm.count("log-level")) {
        cli.log_level = vm["log-level"].as<std::string>();
        try {
            parse_severity(*cli.log_level);
        } catch (const ConfigError&) {
            throw UsageError("unknown log level '" + *cli.log_level + "'");
        }
    }
    cli.preflight_only = vm.count("preflight-only") > 0;
    cli.sync = vm.count("sync") > 0;
    cli.config_path = vm["config"].as<std::string>();

    if (vm.count("type")) {
        auto name = vm["type"].as<std::string>();
        cli.type = content_type_from_name(name);
        if (!cli.type) throw UsageError("unknown content type '" + name + "'");
    }

    if (cli.category_id.has_value() != cli.type_id.has_value()) throw UsageError("--category-id and --type-id go together");
    if ((cli.category_id && *cli.category_id == 0) || (cli.type_id && *cli.type_id == 0)) throw UsageError("category and type ids are positive");

    if (cli.sync) {
        if (cli.input) throw UsageError("--sync takes no input path");
        if (cli.preflight_only || cli.type || cli.category_id) throw UsageError("--sync only combines with --tracker and --config");
    } else if (!cli.input) {
        throw UsageError("no input path given");
    }

    return cli;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " <input> [--tracker NAME]... [--type TYPE] [--category-id N --type-id M] [--preflight-only] [--config FILE]\n"
        << "       " << program << " --sync [--tracker NAME]... [--config FILE]\n\n"
        << option_list();
    return out.str();
}
