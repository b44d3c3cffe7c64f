#ifndef SEVENSEG_OPTIONS_H
#define SEVENSEG_OPTIONS_H

#include <boost/program_options.hpp>
#include <iostream>
#include <string>

#include "sevenseg/style.h"

class Options : public boost::program_options::options_description {
   public:
	Options(void);
	virtual ~Options();
	virtual void parse(int argc, char** argv);

	std::string text;
	std::string config_file;
	std::string output_file;
	std::string preview;
	std::string color;
	std::string skew;
	unsigned int height = 0;
	bool ascii = false;
	bool dump_config = false;
	bool verbose = false;

	// style file first, then the single value switches on top
	sevenseg::Style style;

	virtual void printValues(std::ostream& os = std::cout) const;

   private:
	boost::program_options::positional_options_description pos;
	boost::program_options::variables_map vm;
};

// text of one of the builtin preview sets, throws for unknown names
std::string preview_text(const std::string& name);

#endif
