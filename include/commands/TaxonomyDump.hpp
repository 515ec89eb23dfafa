#pragma once
#include <string>

int taxonomyDump(const std::string& taxonomyPath, const std::string& outPath);
