// definitions for FileMan

#include <fileman.hpp>
#include <util.hpp>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>


FileMan::FileMan(std::string rdir) {
    dir = rdir;
}

FileMan::PathState FileMan::checkPath(std::string path) {
    struct stat sb;
    if (stat(transmuted(path).c_str(), &sb) == 0) {
        if (S_ISDIR(sb.st_mode)) {
            return FileMan::PathState::Directory;
        }
        else if (S_ISREG(sb.st_mode)) {
            return FileMan::PathState::File;
        }
        else {
            return FileMan::PathState::Other;
        }
    }
    else if (errno == ENOENT || errno == ENOTDIR) {
        return FileMan::PathState::CNEP;
    }
    else {
        return FileMan::PathState::Error;
    }
}

FileWriteOutput FileMan::create(std::string name) {
    name = transmuted(name);
    int output = ::open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC, OUTPUT_FILE_MODE);
    if (output == -1) {
        printf(ERROR "Couldn't open output file %s.\n", name.c_str());
        perror("\topen");
    }
    FileWriteOutput fOut(output);
    return fOut;
}

MapView FileMan::open(std::string name) {
    return MapView(transmuted(name));
}

std::string FileMan::transmuted(std::string path) {
    return fconcat(dir, path);
}
