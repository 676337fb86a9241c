#include <session.hpp>


Session::Session(std::string inDir, std::string outDir) : input(inDir), output(outDir) {}

const ContextValue* Session::lookup(const std::string& name) {
    return context.lookup(name);
}

FileMan::PathState Session::checkPath(std::string path) {
    return input.checkPath(path);
}

std::string Session::transmuted(std::string path) {
    return input.transmuted(path);
}

MapView Session::open(std::string path) {
    return input.open(path);
}

FileWriteOutput Session::create(std::string path) {
    return output.create(path);
}
