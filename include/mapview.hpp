// "view" a memory map
// provides reference counted unmapping, view slicing, and the handful of search functions the scanner needs
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE MEMORY MAP
    size_t start; // starting position of this MapView's slice of the memory map
    size_t end; // ending position of this MapView's slice of the memory map
    int* rCount; // counts references to the underlying memory map
    int fd; // file descriptor of the map (-1 for buffers that don't come from a file)
    bool owned = false; // the buffer was malloc'd by fromString and gets freed, not munmapped
    bool valid = false;

    MapView(); // empty and invalid, filled in by fromString

    void init(int, char* mm, size_t size);

    void release();
public:
    static constexpr size_t npos = (size_t)-1;

    MapView(std::string filename); // maps the whole file read-only. Check isValid()!

    static MapView fromString(const std::string& data); // copies data into a private buffer

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    ~MapView();

    bool isValid();

    int64_t len();

    MapView slice(size_t from, size_t len);

    std::string toString(); // COPIES! TRY TO AVOID IT!

    bool cmp(const char* cmp, size_t at = 0);

    size_t find(const char* needle, size_t from = 0); // offset of the first needle at or after from, relative to this view. npos if none

    const char* cbuf(); // get the "underlying c buffer"
    // since this is a MapView, the c buffer will usually be inside a memory map

    MapView consumeWord(); // consume bytes up to the next whitespace and return them as a child MapView

    void trim(); // tosses whitespace towards the `start`.

    void rtrim(); // tosses whitespace towards the `end`.
};
