#include "options.h"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>

namespace po = boost::program_options;

static const std::map<std::string, std::string> PREVIEWS = {
    {"digits", "0123456789"},
    {"upper", "ABCDEFGHIJKLMNOPQRSTUVWXYZ"},
    {"lower", "abcdefghijklmnopqrstuvwxyz"},
    {"hello", "HELLO hello"},
};

std::string preview_text(const std::string& name) {
	auto it = PREVIEWS.find(name);
	if (it == PREVIEWS.end()) {
		throw std::runtime_error("unknown preview '" + name + "' (digits, upper, lower, hello)");
	}
	return it->second;
}

Options::Options(void) {
	// clang-format off
	add_options()
		("help,h", "produce help message")
		("text", po::value<std::string>(&text), "text to show on the readout")
		("config,c", po::value<std::string>(&config_file), "JSON style file")
		("output,o", po::value<std::string>(&output_file), "render into an image file instead of opening a window")
		("height", po::value<unsigned int>(&height), "height of the rendered readout in pixels")
		("color", po::value<std::string>(&color), "segment color, e.g. '#f72727' or 'green'")
		("skew", po::value<std::string>(&skew), "'none', 'traditional' or a custom shear factor")
		("preview", po::value<std::string>(&preview), "show a builtin character set (digits, upper, lower, hello)")
		("ascii", po::bool_switch(&ascii), "print the readout as ASCII art")
		("dump-config", po::bool_switch(&dump_config), "print the effective style as JSON and exit")
		("verbose,v", po::bool_switch(&verbose), "print the effective options to stderr");
	// clang-format on

	pos.add("text", 1);
}

Options::~Options(){};

void Options::parse(int argc, char** argv) {
	try {
		auto parser = po::command_line_parser(argc, argv);
		parser.options(*this).positional(pos);

		po::store(parser.run(), vm);

		if (vm.count("help")) {
			std::cout << *this << std::endl;
			exit(0);
		}

		po::notify(vm);

		if (!config_file.empty() && !sevenseg::loadStyleFile(QString::fromStdString(config_file), style)) {
			std::cerr << "[Options] Error: could not load style file '" << config_file << "'." << std::endl;
			exit(1);
		}
		if (!color.empty()) {
			QColor parsed(QString::fromStdString(color));
			if (!parsed.isValid()) {
				throw std::runtime_error("unable to parse color '" + color + "'");
			}
			style.color = parsed;
		}
		if (!skew.empty() && !sevenseg::parseSkew(QString::fromStdString(skew), style.skew)) {
			throw std::runtime_error("unable to parse skew '" + skew + "'");
		}
		if (vm.count("height")) {
			if (height == 0) {
				throw std::runtime_error("height has to be greater than zero");
			}
			style.height = height;
		}
		if (!preview.empty()) {
			if (!text.empty()) {
				std::cerr << "[Options] Info: switch 'preview' replaces the given text." << std::endl;
			}
			text = preview_text(preview);
		}
	} catch (po::error& e) {
		std::cerr << "Error parsing command line options: " << e.what() << std::endl;

		std::cout << *this << std::endl;
		exit(1);
	} catch (std::runtime_error& e) {
		std::cerr << "[Options] Error: " << e.what() << std::endl;
		exit(1);
	}
}

void Options::printValues(std::ostream& os) const {
	os << std::dec;
	os << "text: " << text << std::endl;
	os << "config_file: " << config_file << std::endl;
	os << "output_file: " << output_file << std::endl;
	os << "color: " << style.color.name().toStdString() << std::endl;
	os << "skew: " << sevenseg::skewName(style.skew).toStdString() << std::endl;
	os << "height: " << style.height << std::endl;
	os << "background: " << style.background.name().toStdString() << std::endl;
	os << "aspect_ratio: " << style.aspect_ratio << std::endl;
	os << "ascii: " << ascii << std::endl;
	os << "dump_config: " << dump_config << std::endl;
}
