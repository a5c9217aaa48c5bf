/*
  catalog.h

  This file is part of plugdock

  MIT License

  Copyright (c) 2026 The plugdock authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <map>
#include <string>
#include <vector>

#include "registry/release_client.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

struct CatalogEntry {
    std::string name;
    // owner/repo
    std::string repository;
    std::string description;
    // "stable" unless the catalog says otherwise; "experimental" is warned about
    std::string security_level = "stable";
    AssetNamingHints asset_hints;

    std::string owner() const;
    std::string repo() const;
};

// Known plugins by name. The document is either a map of name to entry or
// the same map under a top-level "plugins" key.
class PluginCatalog {
   public:
    // A missing file is an empty catalog, not an error.
    static Result<PluginCatalog> load(const std::string& path);
    static Result<PluginCatalog> parse(const std::string& content);

    const CatalogEntry* find(const std::string& name) const;
    Result<CatalogEntry> get(const std::string& name) const;

    void add(const CatalogEntry& entry);

    std::vector<CatalogEntry> entries() const;

    bool empty() const {
        return entries_.empty();
    }

   private:
    std::map<std::string, CatalogEntry> entries_;
};

}  // namespace plugdock
