#pragma once

// Asset path helpers.
// Resolves paths against the first "assets" directory found in the working
// directory or one of its parents, so the binaries work both from the project
// root and from a build directory.
//
// Usage:
//   LoadCatalogFromFile(catalog, assets::Path("levels/catalog.json"));

namespace assets {

// Returns "<assets dir>/<relative>". The returned pointer stays valid until
// the next call on the same thread.
const char* Path(const char* relative);

// Convenience: check if an asset file exists before loading.
bool Exists(const char* relative);

}  // namespace assets
