//
//  main.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Concurrency/ActionQueue.hpp"
#include "Machines/Apple/DOS/DOS.hpp"
#include "Machines/Apple/DOS/Errors.hpp"
#include "Outputs/Log.hpp"
#include "Storage/KeyValue/DirectoryStore.hpp"
#include "Storage/KeyValue/SeedDirectory.hpp"
#include "Storage/KeyValue/Store.hpp"

namespace {

using Logger = Log::Logger<Log::Source::TerminalHost>;

/*!
	The console: output goes to stdout with carriage returns shown as new lines; input
	comes from stdin, one line at a time.
*/
class StdioTerminal: public Apple::DOS::Terminal {
public:
	StdioTerminal(Concurrency::ActionQueue &deliveries) : deliveries_(deliveries) {}

	void write_character(const char c) override {
		std::fputc(c == '\r' ? '\n' : c, stdout);
	}

	void read_character(CharacterReceiver receiver) override {
		const int c = std::fgetc(stdin);
		const char result = c == EOF || c == '\n' ? '\r' : char(c);
		deliveries_.enqueue([receiver = std::move(receiver), result] {
			receiver(result);
		});
	}

	void read_line(LineReceiver receiver, const std::string &prompt) override {
		std::fputs(prompt.c_str(), stdout);
		std::fflush(stdout);

		std::string line;
		std::getline(std::cin, line);
		deliveries_.enqueue([receiver = std::move(receiver), line = std::move(line)] {
			receiver(line);
		});
	}

	void set_firmware_active(const bool active) override {
		Logger::info().append("80-column firmware %s", active ? "enabled" : "disabled");
	}

private:
	Concurrency::ActionQueue &deliveries_;
};

struct ParsedArguments {
	std::vector<std::string> file_names;
	std::map<std::string, std::string> selections;	// The empty string will be inserted for arguments without an = suffix.

	const std::string *selection(const std::string &name) const {
		const auto selection = selections.find(name);
		return selection == selections.end() ? nullptr : &selection->second;
	}
};

/*! Parses an argc/argv pair to discern program arguments. */
ParsedArguments parse_arguments(int argc, char *argv[]) {
	ParsedArguments arguments;

	for(int index = 1; index < argc; ++index) {
		char *arg = argv[index];

		// Accepted format is:
		//
		//	--flag			sets a Boolean option to true.
		//	--flag=value	sets the value for a list option.
		//	name			sets the script file to run.

		// Anything starting with a dash always makes a selection; otherwise it's a file name.
		if(arg[0] == '-') {
			while(*arg == '-') arg++;

			// Check for an equals sign, to discern a Boolean selection from a list selection.
			std::string argument = arg;
			std::size_t split_index = argument.find("=");

			if(split_index == std::string::npos) {
				arguments.selections[argument];	// To create an entry with the default empty string.
			} else {
				const std::string name = argument.substr(0, split_index);
				std::string value = argument.substr(split_index+1, std::string::npos);
				arguments.selections[name] = value;
			}
		} else {
			arguments.file_names.push_back(arg);
		}
	}

	return arguments;
}

/// Converts any combination of the letters C, I and O to the equivalent monitor flags.
int monitor_flags(const std::string &letters) {
	int flags = 0;
	for(const char letter: letters) {
		switch(std::toupper(letter)) {
			case 'C':	flags |= Apple::DOS::Monitor::Commands;	break;
			case 'I':	flags |= Apple::DOS::Monitor::Input;	break;
			case 'O':	flags |= Apple::DOS::Monitor::Output;	break;
			default:
				std::cerr << "Ignoring unknown monitor flag " << letter << std::endl;
			break;
		}
	}
	return flags;
}

void report(const Apple::DOS::Fault &fault) {
	std::string message = fault.what();
	std::transform(message.begin(), message.end(), message.begin(), ::toupper);
	std::printf("\n?%s (%d)\n", message.c_str(), fault.code());
}

}

int main(int argc, char *argv[]) {
	const ParsedArguments arguments = parse_arguments(argc, argv);
	const std::string usage_suffix = " [script] [--store={directory}] [--seed={directory}] [--monitor={C, I and/or O}]";

	if(arguments.selection("help") || arguments.selection("h")) {
		std::cout << "Usage: " << argv[0] << usage_suffix << std::endl << std::endl;
		std::cout << "Runs a script as if it were a BASIC program's output. Each line is PRINTed, with a leading ^D" << std::endl;
		std::cout << "becoming Ctrl-D. A line '<' INPUTs a line and '<n' GETs n characters; both display the result." << std::endl << std::endl;
		std::cout << "\t--store\t\tkeeps files in the nominated directory; otherwise they are lost at exit." << std::endl;
		std::cout << "\t--seed\t\tsupplies initial file contents from the nominated directory." << std::endl;
		std::cout << "\t--monitor\tenables MON tracing from the start." << std::endl;
		return EXIT_SUCCESS;
	}

	// Establish storage.
	std::unique_ptr<Storage::KeyValue::Store> store;
	if(const auto path = arguments.selection("store"); path) {
		try {
			store = std::make_unique<Storage::KeyValue::DirectoryStore>(*path);
		} catch(Storage::KeyValue::Error) {
			std::cerr << "Cannot use " << *path << " as a store" << std::endl;
			return EXIT_FAILURE;
		}
	} else {
		store = std::make_unique<Storage::KeyValue::MemoryStore>();
	}

	std::unique_ptr<Storage::KeyValue::SeedDirectory> seeds;
	if(const auto path = arguments.selection("seed"); path) {
		seeds = std::make_unique<Storage::KeyValue::SeedDirectory>(*path);
	}

	Apple::DOS::Options options;
	if(const auto letters = arguments.selection("monitor"); letters) {
		options.monitor = monitor_flags(*letters);
	}

	// Pick a script.
	std::ifstream script_file;
	if(!arguments.file_names.empty()) {
		script_file.open(arguments.file_names.front());
		if(!script_file.is_open()) {
			std::cerr << "Cannot open " << arguments.file_names.front() << std::endl;
			return EXIT_FAILURE;
		}
	}
	std::istream &script = script_file.is_open() ? static_cast<std::istream &>(script_file) : std::cin;

	Concurrency::ActionQueue deliveries;
	StdioTerminal console(deliveries);
	Apple::DOS::DOS dos(console, *store, deliveries, seeds.get(), options);
	auto &terminal = dos.terminal();

	std::string line;
	while(std::getline(script, line)) {
		try {
			if(!line.empty() && line[0] == '<') {
				const int count = line.size() > 1 ? std::atoi(line.c_str() + 1) : 0;
				if(count > 0) {
					for(int index = 0; index < count; index++) {
						terminal.read_character([](const char c) {
							std::fputc(c == '\r' ? '\n' : c, stdout);
						});
					}
				} else {
					terminal.read_line([](const std::string &input) {
						std::printf("%s\n", input.c_str());
					}, "?");
				}
			} else {
				if(line.compare(0, 2, "^D") == 0) {
					line.replace(0, 2, 1, Apple::DOS::Channel::CommandCharacter);
				}
				terminal.write_string(line);
				terminal.write_character('\r');
			}
		} catch(const Apple::DOS::Fault &fault) {
			report(fault);
		}

		deliveries.flush();
	}

	// Files are closed implicitly at exit, as per a BASIC program that ends without CLOSE.
	try {
		terminal.write_string(std::string(1, Apple::DOS::Channel::CommandCharacter) + "CLOSE\r");
	} catch(const Apple::DOS::Fault &fault) {
		report(fault);
		return EXIT_FAILURE;
	}
	std::fflush(stdout);
	return EXIT_SUCCESS;
}
