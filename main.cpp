#include <SeedTools.hpp>
#include <Errors.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    CommandLine cli;
    try {
        cli = parse_command_line(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }

    if (cli.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    AppConfig config;
    try {
        config = load_config(cli.config_path);
        if (cli.log_level) config.logging.level = *cli.log_level;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    Logging logging(config.logging);
    SeedTools app(std::move(config), logging.logger());

    try {
        return app.run(cli);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
}
