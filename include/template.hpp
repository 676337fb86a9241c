// A Template is the immutable source text plus the directory it came from, and the directives found in it.
// Directives are found once, up front, and never change; rendering walks over them as many times as loops ask it to.
#pragma once
#include <defs.h>
#include <mapview.hpp>
#include <directive.hpp>
#include <string>
#include <vector>


struct Template {
    MapView text;
    std::string dir; // where includes are resolved from
    std::vector<Directive*> directives;

    Template(MapView source, std::string directory);

    Template(const Template&) = delete; // owns the directives

    ~Template();

    static Template* open(std::string path, int* status = NULL); // read path into memory and tokenize it. NULL if the file couldn't be read or
    // doesn't parse (already logged), with the reason in *status if status isn't NULL. The caller deletes the result.

    static Template* fromString(const std::string& text, std::string directory, int* status = NULL); // same, from a buffer. includes resolve against directory

    bool isValid();

    int tokenize(); // RENDER_EXIT_OK or RENDER_EXIT_PARSE

private:
    static Template* load(Template* ret, int* status); // tokenize ret, deleting it if that fails
};
