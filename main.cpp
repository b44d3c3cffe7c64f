#include <QApplication>
#include <QCoreApplication>
#include <QJsonDocument>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "options.h"
#include "sevenseg/painter.h"
#include "window/readout_view.h"

using namespace sevenseg;

static void printAscii(const Readout& readout, std::ostream& os) {
	std::vector<std::string> lines(3);
	for (DisplayState state : readout.states()) {
		std::istringstream art(toAscii(state));
		std::string line;
		for (unsigned row = 0; row < lines.size() && std::getline(art, line); row++) {
			lines[row] += line;
		}
	}
	for (const std::string& line : lines) {
		os << line << std::endl;
	}
}

int main(int argc, char* argv[]) {
	Options opt;
	opt.parse(argc, argv);

	if (opt.verbose) {
		opt.printValues(std::cerr);
	}

	if (opt.dump_config) {
		std::cout << QJsonDocument(opt.style.toJSON()).toJson().toStdString();
		return 0;
	}

	if (opt.text.empty() && opt.output_file.empty() && !opt.ascii) {
		std::cout << "No text given. For usage instructions, pass -h" << std::endl;
	}

	const QString text = QString::fromStdString(opt.text);
	const Readout readout = Readout::resembling(text, opt.style.color, opt.style.skew);

	if (opt.ascii) {
		printAscii(readout, std::cout);
	}

	if (!opt.output_file.empty()) {
		QCoreApplication a(argc, argv);
		QImage image = renderImage(readout, opt.style);
		if (!image.save(QString::fromStdString(opt.output_file))) {
			std::cerr << "[Render] Could not write image " << opt.output_file << std::endl;
			return 1;
		}
		std::cout << "[Render] " << readout.size() << " displays written to " << opt.output_file << " ("
		          << image.width() << "x" << image.height() << ")" << std::endl;
		return 0;
	}

	if (opt.ascii) {
		return 0;
	}

	QApplication a(argc, argv);
	ReadoutView view(opt.style, text);
	view.setWindowTitle(text.isEmpty() ? QString("sevenseg") : text);
	view.show();

	return a.exec();
}
