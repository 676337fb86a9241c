// the directive scanner. Directives look like /** keyword argument **/ - the argument is optional and can't contain whitespace,
// and the directive always ends at the first **/ after it opens.
#pragma once
#include <defs.h>
#include <directive.hpp>
#include <mapview.hpp>
#include <string>
#include <vector>

#define SCAN_FOUND 0 // match was filled in
#define SCAN_EOF   1 // no directive at or after the offset
#define SCAN_BAD   2 // there's something that starts like a directive but isn't one (already logged)


struct ScanMatch {
    Directive::Kind kind;
    std::string argument;
    size_t start;
    size_t end;
};


int scanDirective(MapView& text, size_t from, ScanMatch& match); // find the leftmost directive at or after `from`

int tokenize(MapView& text, std::vector<Directive*>& directives); // scan the whole text front to back into directives.
// returns RENDER_EXIT_OK or RENDER_EXIT_PARSE. On failure `directives` holds whatever was made before the bad one; the caller still owns them.
