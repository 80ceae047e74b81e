#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "structures.hpp"

// A POI as read from an input file
struct POI {
    double lat;
    double lng;
    std::string name;
};

// One POI per line: "lat lng [name...]". Blank, comment and malformed lines are skipped.
std::vector<POI> readPOIs(std::istream& in);

// Throws std::runtime_error if the file cannot be opened
std::vector<POI> readPOIFile(const std::string& filename);

// Plain-text zone listing, see writeZones in io.cpp for the layout
void writeZones(std::ostream& out, const std::vector<Zone>& zones);
