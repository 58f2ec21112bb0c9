#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/// Print usage and the grouped option list to standard output.
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
