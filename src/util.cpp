#include <util.hpp>
// definitions for util functions


bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}


std::string fconcat(std::string one, std::string two) {
    if (one.size() == 0) { // no base directory means "relative to the working directory"
        return two;
    }
    if (two.size() > 0 && two[0] == '/') { // absolute paths don't get glued to anything
        return two;
    }
    if (one[one.size() - 1] == '/') {
        return one + two;
    }
    return one + '/' + two;
}


std::string trim2dir(std::string file) {
    size_t slash = file.rfind('/');
    if (slash == std::string::npos) { // bare filename, it lives in the working directory
        return "";
    }
    return file.substr(0, slash + 1);
}
