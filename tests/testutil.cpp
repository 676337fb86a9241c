#include <testutil.hpp>
#include <ftw.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>


static int iterRemove(const char* fpath, const struct stat*, int, struct FTW*) {
    return remove(fpath);
}


TempDir::TempDir() {
    char name[] = "/tmp/quill-test-XXXXXX";
    if (mkdtemp(name) == NULL) {
        perror("mkdtemp");
        abort(); // nothing in the test can work without it
    }
    path = name;
}

TempDir::~TempDir() {
    nftw(path.c_str(), iterRemove, 64, FTW_DEPTH | FTW_PHYS);
}

std::string TempDir::mkdir(std::string name) {
    std::string full = path;
    size_t pos = 0;
    while (pos <= name.size()) {
        size_t slash = name.find('/', pos);
        if (slash == std::string::npos) {
            slash = name.size();
        }
        full = path + "/" + name.substr(0, slash);
        ::mkdir(full.c_str(), 0755);
        pos = slash + 1;
    }
    return full;
}

std::string TempDir::write(std::string name, std::string content) {
    size_t slash = name.rfind('/');
    if (slash != std::string::npos) {
        mkdir(name.substr(0, slash));
    }
    std::string full = path + "/" + name;
    FILE* f = fopen(full.c_str(), "wb");
    if (f == NULL) {
        perror("fopen");
        return full;
    }
    fwrite(content.data(), 1, content.size(), f);
    fclose(f);
    return full;
}

std::string TempDir::read(std::string name) {
    std::string full = path + "/" + name;
    FILE* f = fopen(full.c_str(), "rb");
    if (f == NULL) {
        return "";
    }
    std::string ret;
    char buffer[4096];
    size_t got;
    while ((got = fread(buffer, 1, sizeof(buffer), f)) > 0) {
        ret.append(buffer, got);
    }
    fclose(f);
    return ret;
}
