#include <types/VariableStatement.hpp>
#include <renderstate.hpp>
#include <session.hpp>
#include <writeoutput.hpp>
#include <cstdio>


VariableStatement::VariableStatement(std::string arg, size_t s, size_t e) : Directive(VARIABLE, arg, s, e) {}

int VariableStatement::execute(RenderState* state) {
    const ContextValue* value = state -> session -> lookup(argument);
    if (value == NULL) { // missing variables quietly render as nothing
        return RENDER_EXIT_OK;
    }
    if (value -> type == ContextValue::LIST) {
        printf(WARNING "%s is a list, not a string; variable at offset %zu renders as nothing. Did you mean loopover?\n", argument.c_str(), start);
        return RENDER_EXIT_OK;
    }
    return state -> out -> write(value -> scalar);
}
