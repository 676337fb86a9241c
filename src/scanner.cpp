#include <scanner.hpp>
#include <types/LoopOverStatement.hpp>
#include <cstdio>
#include <cstring>


struct KeywordEntry {
    const char* name;
    Directive::Kind kind;
    bool needsArgument;
};

static const KeywordEntry keywords[] = {
    { "include",  Directive::INCLUDE,  true },
    { "variable", Directive::VARIABLE, true },
    { "loopover", Directive::LOOPOVER, true },
    { "loopvar",  Directive::LOOPVAR,  false },
    { "endloop",  Directive::ENDLOOP,  false }
};


int scanDirective(MapView& text, size_t from, ScanMatch& match) {
    size_t open = text.find(DIRECTIVE_OPEN, from);
    if (open == MapView::npos) {
        return SCAN_EOF;
    }
    size_t bodyStart = open + strlen(DIRECTIVE_OPEN);
    size_t close = text.find(DIRECTIVE_CLOSE, bodyStart); // the first close marker ends it, no matter what's inside
    if (close == MapView::npos) {
        printf(ERROR "Unterminated directive at offset %zu: there's no " DIRECTIVE_CLOSE " after it.\n", open);
        return SCAN_BAD;
    }
    MapView body = text.slice(bodyStart, close - bodyStart);
    body.trim();
    body.rtrim();
    MapView keyword = body.consumeWord();
    body.trim();
    MapView argument = body.consumeWord();
    body.trim();
    if (keyword.len() == 0) {
        printf(ERROR "Empty directive at offset %zu.\n", open);
        return SCAN_BAD;
    }
    if (body.len() > 0) {
        printf(ERROR "Directive at offset %zu has more than one argument (\"%s\" is left over).\n", open, body.toString().c_str());
        return SCAN_BAD;
    }
    for (const KeywordEntry& entry : keywords) {
        if ((size_t)keyword.len() == strlen(entry.name) && keyword.cmp(entry.name)) {
            if (entry.needsArgument && argument.len() == 0) {
                printf(ERROR "%s at offset %zu needs an argument.\n", entry.name, open);
                return SCAN_BAD;
            }
            match.kind = entry.kind;
            match.argument = argument.toString();
            match.start = open;
            match.end = close + strlen(DIRECTIVE_CLOSE);
            return SCAN_FOUND;
        }
    }
    printf(ERROR "Unrecognized directive keyword '%s' at offset %zu.\n", keyword.toString().c_str(), open);
    return SCAN_BAD;
}

int tokenize(MapView& text, std::vector<Directive*>& directives) {
    std::vector<LoopOverStatement*> unmatched; // loopovers still waiting on an endloop
    size_t offset = 0;
    while (true) {
        ScanMatch match;
        int r = scanDirective(text, offset, match);
        if (r == SCAN_EOF) {
            break;
        }
        if (r == SCAN_BAD) {
            return RENDER_EXIT_PARSE;
        }
        Directive* d = makeDirective(match.kind, match.argument, match.start, match.end);
        if (match.kind == Directive::LOOPOVER) {
            unmatched.push_back((LoopOverStatement*)d);
        }
        else if (match.kind == Directive::ENDLOOP) {
            for (LoopOverStatement* l : unmatched) { // loops don't nest, so every open loopover closes on the first endloop after it
                l -> endToken = directives.size();
            }
            unmatched.clear();
        }
        directives.push_back(d);
        offset = match.end;
    }
    for (LoopOverStatement* l : unmatched) {
        printf(WARNING "loopover %s at offset %zu has no matching endloop; its body runs to the end of the template.\n", l -> argument.c_str(), l -> start);
    }
    return RENDER_EXIT_OK;
}
