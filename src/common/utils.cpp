#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
using namespace std;

namespace solbuild {

vector<string> split_arguments(const string &options) {
    vector<string> splitted, result;
    boost::split(splitted, options, boost::is_any_of(" \t\n"), boost::token_compress_on);
    for (auto &token : splitted)
        if (!token.empty())
            result.push_back(token);
    return result;
}

}  // namespace solbuild
