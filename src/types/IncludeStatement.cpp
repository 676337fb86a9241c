#include <types/IncludeStatement.hpp>
#include <renderstate.hpp>
#include <session.hpp>
#include <writeoutput.hpp>
#include <cstdio>


IncludeStatement::IncludeStatement(std::string arg, size_t s, size_t e) : Directive(INCLUDE, arg, s, e) {}

int IncludeStatement::execute(RenderState* state) { // no caching: inside a loop the file is mapped again on every pass
    Session* session = state -> session;
    std::string path = session -> transmuted(argument);
    FileMan::PathState pathState = session -> checkPath(argument);
    if (pathState == FileMan::PathState::CNEP) {
        printf(ERROR "Can't include %s (at offset %zu): it doesn't exist.\n", path.c_str(), start);
        return RENDER_EXIT_IO;
    }
    if (pathState == FileMan::PathState::Directory) {
        printf(ERROR "Can't include %s (at offset %zu): it's a directory.\n", path.c_str(), start);
        return RENDER_EXIT_IO;
    }
    MapView content = session -> open(argument);
    if (!content.isValid()) {
        printf(ERROR "Can't include %s (at offset %zu).\n", path.c_str(), start);
        return RENDER_EXIT_IO;
    }
    return state -> out -> write(content);
}
