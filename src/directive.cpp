#include <directive.hpp>
#include <types/IncludeStatement.hpp>
#include <types/VariableStatement.hpp>
#include <types/LoopOverStatement.hpp>
#include <types/LoopVarStatement.hpp>
#include <types/EndLoopStatement.hpp>


Directive::Directive(Kind k, std::string arg, size_t s, size_t e) : kind(k), argument(arg), start(s), end(e) {}

Directive::~Directive() {}

std::string Directive::describe() {
    std::string ret = keyword(kind);
    if (argument.size() > 0) {
        ret += " " + argument;
    }
    return ret;
}

const char* Directive::keyword(Kind k) {
    switch (k) {
        case INCLUDE:
            return "include";
        case VARIABLE:
            return "variable";
        case LOOPOVER:
            return "loopover";
        case LOOPVAR:
            return "loopvar";
        case ENDLOOP:
            return "endloop";
    }
    return "?";
}

Directive* makeDirective(Directive::Kind kind, std::string argument, size_t start, size_t end) {
    switch (kind) {
        case Directive::INCLUDE:
            return new IncludeStatement(argument, start, end);
        case Directive::VARIABLE:
            return new VariableStatement(argument, start, end);
        case Directive::LOOPOVER:
            return new LoopOverStatement(argument, start, end);
        case Directive::LOOPVAR:
            return new LoopVarStatement(argument, start, end);
        case Directive::ENDLOOP:
            return new EndLoopStatement(argument, start, end);
    }
    return NULL;
}
