#include <render.hpp>
#include <renderstate.hpp>
#include <template.hpp>
#include <directive.hpp>
#include <writeoutput.hpp>
#include <cstdio>


const char* renderErrorName(int code) {
    switch (code) {
        case RENDER_EXIT_OK:
            return "OK";
        case RENDER_EXIT_IO:
            return "IOError";
        case RENDER_EXIT_PARSE:
            return "ParseError";
        case RENDER_EXIT_TYPE:
            return "TypeMismatchError";
        case RENDER_EXIT_LOOPSTATE:
            return "LoopStateError";
        case RENDER_EXIT_USAGE:
            return "UsageError";
    }
    return "UnknownError";
}


RenderState::RenderState(Template* t, Session* s, WriteOutput* o) : tmpl(t), session(s), out(o) {}


int renderTemplate(Template* tmpl, Session* session, WriteOutput* out) {
    RenderState state(tmpl, session, out);
    MapView& text = tmpl -> text;
    std::vector<Directive*>& directives = tmpl -> directives;
    while (state.next < directives.size()) {
        Directive* d = directives[state.next];
        int r = out -> write(text.slice(state.cursor, d -> start - state.cursor));
        if (r != RENDER_EXIT_OK) {
            return r;
        }
        state.cursor = d -> end;
        state.next ++;
        r = d -> execute(&state);
        if (r != RENDER_EXIT_OK) {
            printf(ERROR "Rendering stopped at %s (offset %zu) with %s.\n", d -> describe().c_str(), d -> start, renderErrorName(r));
            return r;
        }
    }
    return out -> write(text.slice(state.cursor, text.len() - state.cursor));
}

int renderToString(Template* tmpl, Session* session, std::string& result) {
    StringWriteOutput out;
    int r = renderTemplate(tmpl, session, &out);
    result = out.content;
    return r;
}
