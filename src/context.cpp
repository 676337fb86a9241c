#include <nlohmann/json.hpp>
#include <context.hpp>
#include <mapview.hpp>
#include <cstdio>

using json = nlohmann::json;


static bool flatten(const json& item, std::string& out) { // numbers and booleans come through as their JSON text, strings verbatim
    if (item.is_string()) {
        out = item.get<std::string>();
        return true;
    }
    if (item.is_number() || item.is_boolean()) {
        out = item.dump();
        return true;
    }
    return false;
}


const ContextValue* Context::lookup(const std::string& name) const {
    auto found = values.find(name);
    if (found == values.end()) {
        return NULL;
    }
    return &found -> second;
}

void Context::set(std::string name, std::string value) {
    ContextValue v;
    v.type = ContextValue::SCALAR;
    v.scalar = value;
    values[name] = v;
}

void Context::setList(std::string name, std::vector<std::string> items) {
    ContextValue v;
    v.type = ContextValue::LIST;
    v.list = items;
    values[name] = v;
}

size_t Context::size() const {
    return values.size();
}

int Context::parse(const std::string& document, const std::string& origin) {
    json root = json::parse(document, nullptr, false); // no exceptions; a bad document comes back discarded
    if (root.is_discarded()) {
        printf(ERROR "%s is not valid JSON.\n", origin.c_str());
        return RENDER_EXIT_PARSE;
    }
    if (!root.is_object()) {
        printf(ERROR "%s must hold a JSON object at the top level, found %s.\n", origin.c_str(), root.type_name());
        return RENDER_EXIT_PARSE;
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
        const json& value = it.value();
        std::string scalar;
        if (value.is_null()) {
            printf(WARNING "%s: %s is null and will be treated as if it weren't there.\n", origin.c_str(), it.key().c_str());
        }
        else if (value.is_array()) {
            std::vector<std::string> items;
            for (size_t i = 0; i < value.size(); i ++) {
                std::string item;
                if (!flatten(value[i], item)) {
                    printf(ERROR "%s: element %zu of %s is a %s; lists may only hold strings, numbers and booleans.\n", origin.c_str(), i, it.key().c_str(), value[i].type_name());
                    return RENDER_EXIT_PARSE;
                }
                items.push_back(item);
            }
            setList(it.key(), items);
        }
        else if (flatten(value, scalar)) {
            set(it.key(), scalar);
        }
        else {
            printf(ERROR "%s: %s is a nested %s, which contexts can't hold.\n", origin.c_str(), it.key().c_str(), value.type_name());
            return RENDER_EXIT_PARSE;
        }
    }
    return RENDER_EXIT_OK;
}

int Context::load(std::string path) {
    MapView map(path);
    if (!map.isValid()) {
        printf(ERROR "Couldn't read context file %s.\n", path.c_str());
        return RENDER_EXIT_IO;
    }
    return parse(map.toString(), path);
}
