#pragma once
#include <string>
#include <defs.h>

bool isWhitespace(char thing);

std::string fconcat(std::string one, std::string two); // glue a filename onto a directory ("templates" + "head.html" is "templates/head.html"). Absolute filenames pass through untouched.

std::string trim2dir(std::string file); // strip off a filename from a path
// if the path ends in /, it will not be changed
// the output will always be formatted for quick appending: if it is not fully stripped to an empty string, the last character will be a /
