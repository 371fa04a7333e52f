#pragma once

// Precompiled header: stable standard library headers only. Project headers
// stay out so option-dependent declarations never leak into the PCH.
//
// Enabled via CMake option: NEUROSYNC_ENABLE_PCH=ON

#include <algorithm>
#include <cctype>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <locale>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
