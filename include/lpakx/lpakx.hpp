#pragma once

// LPAK Bundle Library
// A C++20 library for reading the LPAK bundle format used by DoubleFine's
// remastered adventure games (Day of the Tentacle Remastered and others).

#include "bundle.hpp"
#include "extractor.hpp"
#include "glob.hpp"
#include "index_reader.hpp"
#include "types.hpp"

// The library is read-only and works in two steps:
//
// 1. Bundle + IndexReader
//    - Bundle::open() maps the container file
//    - IndexReader::parse() decodes its directory into an EntryTable
//
// 2. listPaths() / Extractor
//    - listPaths() is a lazy view of matching entry paths
//    - Extractor::extract() writes matching entries under a destination root
//
// Example usage:
//
//   auto bundle = lpakx::Bundle::open("tenta.cle");
//   auto table = lpakx::IndexReader::parse(bundle);
//
//   for (const auto &path : lpakx::listPaths(table, "audio/*")) {
//     std::cout << path << std::endl;
//   }
//
//   lpakx::Extractor extractor(bundle);
//   auto report = extractor.extract(table, {"audio/*", "out"});
//
// Format problems throw lpakx::FormatError, extraction failures lpakx::IoError.

namespace lpakx {}
