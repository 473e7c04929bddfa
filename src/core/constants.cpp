#include "fr_search/constants.hpp"
#include <boost/math/constants/constants.hpp>
#include <algorithm>

namespace fr_search {

namespace mc = boost::math::constants;

const std::vector<std::string>& ConstantRegistry::names() {
    static const std::vector<std::string> names = {
        "pi", "e", "zeta3", "catalan", "euler", "ln2", "sqrt2", "golden"};
    return names;
}

bool ConstantRegistry::contains(const std::string& name) {
    const auto& all = names();
    return std::find(all.begin(), all.end(), name) != all.end();
}

std::optional<BigFloat> ConstantRegistry::value(const std::string& name) {
    if (name == "pi") return mc::pi<BigFloat>();
    if (name == "e") return mc::e<BigFloat>();
    if (name == "zeta3") return mc::zeta_three<BigFloat>();
    if (name == "catalan") return mc::catalan<BigFloat>();
    if (name == "euler") return mc::euler<BigFloat>();
    if (name == "ln2") return mc::ln_two<BigFloat>();
    if (name == "sqrt2") return BigFloat(sqrt(BigFloat(2)));
    if (name == "golden") return BigFloat((1 + sqrt(BigFloat(5))) / 2);
    return std::nullopt;
}

} // namespace fr_search
