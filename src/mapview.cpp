// "view" a memory map
// provides reference counted unmapping, view slicing, and the handful of search functions the scanner needs

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <util.hpp>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>


void MapView::init(int file, char* mm, size_t size) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
    valid = true;
}

MapView::MapView() {
    rCount = new int(1);
    map = NULL;
    length = 0;
    start = 0;
    end = 0;
    fd = -1;
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    map = NULL;
    length = 0;
    start = 0;
    end = 0;
    int file = open(filename.c_str(), O_RDONLY);
    fd = file; // so when the destructor calls it gets closed properly
    if (file == -1) {
        printf(ERROR "Can't open %s for memory mapping!\n", filename.c_str());
        perror("\topen");
        return;
    }
    struct stat sb;
    if (fstat(file, &sb)) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tfstat");
        return;
    }
    if (!S_ISREG(sb.st_mode)) {
        printf(ERROR "%s is not a regular file and can't be memory mapped.\n", filename.c_str());
        return;
    }
    if (sb.st_size == 0) { // mmap refuses zero-length maps, but an empty file is still a perfectly good (empty) view
        init(file, NULL, 0);
        return;
    }
    char* mm = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (mm == MAP_FAILED) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
    init(file, mm, sb.st_size);
}

MapView MapView::fromString(const std::string& data) {
    MapView ret;
    char* buffer = NULL;
    if (data.size() > 0) {
        buffer = (char*)malloc(data.size());
        memcpy(buffer, data.c_str(), data.size());
    }
    ret.init(-1, buffer, data.size());
    ret.owned = true;
    return ret;
}

MapView::MapView(const MapView& m) {
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    owned = m.owned;
    valid = m.valid;
    (*rCount) ++;
}

MapView& MapView::operator=(const MapView& m) {
    if (this == &m) {
        return *this;
    }
    (*m.rCount) ++; // bump first, in case we're the last other reference
    release();
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    owned = m.owned;
    valid = m.valid;
    return *this;
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (map != NULL) {
            if (owned) {
                free(map);
            }
            else {
                munmap(map, length);
            }
        }
        if (fd != -1) {
            close(fd);
        }
    }
}

MapView::~MapView() {
    release();
}

bool MapView::isValid() {
    return valid;
}

int64_t MapView::len() {
    return end - start;
}

MapView MapView::slice(size_t from, size_t len) {
    MapView ret(*this);
    ret.start = start + from;
    ret.end = start + from + len;
    if (ret.end > end) {
        ret.end = end;
    }
    if (ret.start > ret.end) {
        ret.start = ret.end;
    }
    return ret;
}

std::string MapView::toString() { // COPIES! TRY TO AVOID IT!
    if (map == NULL) {
        return "";
    }
    return std::string(map + start, end - start);
}

bool MapView::cmp(const char* cmp, size_t at) {
    size_t cmpLen = strlen(cmp);
    if (start + at + cmpLen > end) { // not enough room left for a match
        return false;
    }
    return memcmp(map + start + at, cmp, cmpLen) == 0;
}

size_t MapView::find(const char* needle, size_t from) {
    size_t needleLen = strlen(needle);
    if (needleLen == 0 || map == NULL) {
        return npos;
    }
    for (size_t i = from; start + i + needleLen <= end; i ++) {
        if (map[start + i] == needle[0] && memcmp(map + start + i, needle, needleLen) == 0) {
            return i;
        }
    }
    return npos;
}

const char* MapView::cbuf() {
    return (map + start);
}

MapView MapView::consumeWord() {
    MapView ret = *this;
    while (len() > 0 && !isWhitespace(map[start])) {
        start ++;
    }
    ret.end = start;
    return ret;
}

void MapView::trim() { // tosses whitespace towards the `start`.
    while (start < end && isWhitespace(map[start])) {start ++;} // continue to strip off bytes until they're not whitespace
}

void MapView::rtrim() {
    while (end > start && isWhitespace(map[end - 1])) {end --;}
}
