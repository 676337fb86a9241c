#include <types/LoopVarStatement.hpp>
#include <renderstate.hpp>
#include <writeoutput.hpp>
#include <cstdio>


LoopVarStatement::LoopVarStatement(std::string arg, size_t s, size_t e) : Directive(LOOPVAR, arg, s, e) {}

int LoopVarStatement::execute(RenderState* state) {
    if (!state -> looping) {
        printf(ERROR "loopvar at offset %zu isn't inside a loop.\n", start);
        return RENDER_EXIT_LOOPSTATE;
    }
    return state -> out -> write((*state -> loop.list)[state -> loop.index]);
}
