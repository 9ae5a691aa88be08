/**
 * @file types.cpp
 * @brief Step serialization for keyword classification.
 */

#include "core/types.hpp"

namespace pipeline_dag {

std::string Step::serialize() const {
    std::string text;
    if (!name.empty()) text += "name: " + name + "; ";
    if (!uses.empty()) text += "uses: " + uses + "; ";
    if (!run.empty())  text += "run: " + run + "; ";
    for (const auto& [key, value] : with) {
        text += "with." + key + ": " + value + "; ";
    }
    return text;
}

}  // namespace pipeline_dag
