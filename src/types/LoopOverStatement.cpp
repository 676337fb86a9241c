#include <types/LoopOverStatement.hpp>
#include <renderstate.hpp>
#include <session.hpp>
#include <template.hpp>
#include <cstdio>


LoopOverStatement::LoopOverStatement(std::string arg, size_t s, size_t e) : Directive(LOOPOVER, arg, s, e) {}

int LoopOverStatement::execute(RenderState* state) {
    if (state -> looping) {
        printf(ERROR "loopover %s at offset %zu is inside another loop; loops don't nest.\n", argument.c_str(), start);
        return RENDER_EXIT_LOOPSTATE;
    }
    const ContextValue* value = state -> session -> lookup(argument);
    if (value != NULL && value -> type == ContextValue::SCALAR) {
        printf(ERROR "loopover %s at offset %zu: %s is a string, not a list.\n", argument.c_str(), start, argument.c_str());
        return RENDER_EXIT_TYPE;
    }
    if (value == NULL || value -> list.size() == 0) { // nothing to iterate over: skip the whole body, endloop included
        Template* tmpl = state -> tmpl;
        if (endToken < tmpl -> directives.size()) {
            state -> next = endToken + 1;
            state -> cursor = tmpl -> directives[endToken] -> end;
        }
        else {
            state -> next = tmpl -> directives.size();
            state -> cursor = tmpl -> text.len();
        }
        return RENDER_EXIT_OK;
    }
    state -> looping = true;
    state -> loop.list = &value -> list;
    state -> loop.index = 0;
    state -> loop.bodyStart = end; // == state -> cursor
    state -> loop.bodyToken = state -> next;
    return RENDER_EXIT_OK;
}
