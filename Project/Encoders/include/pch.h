#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <memory>
#include <unordered_map>
#include <map>
#include <set>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <functional>
#include <algorithm>
#include <utility>
#include <stdexcept>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <typeindex>
#include <typeinfo>

// Third-party headers (stable, never change)
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <rapidjson/ostreamwrapper.h>
