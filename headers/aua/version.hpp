//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_VERSION_HPP
#define AUA_VERSION_HPP

#include <string_view>

namespace aua {

    // Kept in step with project(VERSION) in CMakeLists.txt.
    inline constexpr std::string_view VERSION_STRING = "0.1.0";

    inline constexpr std::string_view PROJECT_NAME = "API Usage Analyzer";
    inline constexpr std::string_view PROJECT_SHORT_NAME = "aua";

}  // namespace aua

#endif //AUA_VERSION_HPP
