// quicklaunch: keyboard-driven launcher for applications, executables and documents
// Licensed under GNU GPL v3+

#include "application.h"
#include "config_parser.h"
#include "exit_codes_t.h"

#include <iostream>

// ============================================================================
// Main
// ============================================================================

int main(const int argc, char* const argv[])
{
	try {
		if (argc > 2) {
			std::cout << "Usage: " << argv[0] << " [config_xml_file]\n"
			          << "Type to filter, Up/Down to select, Enter to launch, "
			          << "F5 to rescan, Esc to quit\n";
			return ExitUsage;
		}

		Config config = {};
		if (argc == 2) {
			auto parsed = ConfigParser::parse(argv[1]);
			if (!parsed) {
				return ExitError;
			}
			config = std::move(*parsed);
		}
		apply_path_defaults(config);

		Application app(std::move(config));
		return app.run();
	} catch (const std::exception& e) {
		std::cerr << "Fatal error in main: " << e.what() << '\n';
		return ExitError;
	}
}
