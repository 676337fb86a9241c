// Context is the data a template is rendered against: a flat map of names to either a string or a list of strings.
// It's filled once before rendering (usually from a JSON file) and only ever read while a template renders.
#pragma once
#include <defs.h>
#include <map>
#include <string>
#include <vector>


struct ContextValue {
    enum Type {
        SCALAR, // a plain string, usable by [variable]
        LIST    // an ordered list of strings, usable by [loopover]
    } type = SCALAR;

    std::string scalar;
    std::vector<std::string> list;
};


struct Context {
    std::map<std::string, ContextValue> values;

    const ContextValue* lookup(const std::string& name) const; // NULL means "not there", which is not an error for anybody

    void set(std::string name, std::string value);

    void setList(std::string name, std::vector<std::string> items);

    size_t size() const;

    int parse(const std::string& document, const std::string& origin = "<context>"); // parse a JSON object into this context.
    // returns RENDER_EXIT_OK or RENDER_EXIT_PARSE; origin only shows up in log lines.

    int load(std::string path); // map the file and parse() it. RENDER_EXIT_IO if it can't be read.
};
