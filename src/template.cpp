#include <template.hpp>
#include <scanner.hpp>
#include <util.hpp>
#include <cstdio>


Template::Template(MapView source, std::string directory) : text(source), dir(directory) {}

Template::~Template() {
    for (Directive* d : directives) {
        delete d;
    }
}

Template* Template::load(Template* ret, int* status) {
    int r = ret -> tokenize();
    if (status != NULL) {
        *status = r;
    }
    if (r != RENDER_EXIT_OK) {
        delete ret;
        return NULL;
    }
    return ret;
}

Template* Template::open(std::string path, int* status) {
    MapView file(path);
    if (!file.isValid()) {
        printf(ERROR "Couldn't read template %s.\n", path.c_str());
        if (status != NULL) {
            *status = RENDER_EXIT_IO;
        }
        return NULL;
    }
    // the map is only held long enough to copy it out. the output file may well be this same file, and creating it truncates it
    return load(new Template(MapView::fromString(file.toString()), trim2dir(path)), status);
}

Template* Template::fromString(const std::string& text, std::string directory, int* status) {
    return load(new Template(MapView::fromString(text), directory), status);
}

bool Template::isValid() {
    return text.isValid();
}

int Template::tokenize() {
    for (Directive* d : directives) { // tokenizing twice just starts over
        delete d;
    }
    directives.clear();
    return ::tokenize(text, directives);
}
