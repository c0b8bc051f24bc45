#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <stdexcept>

namespace sandbox {
using namespace std;
namespace bai = boost::archive::iterators;

string base64_encode(const string &bytes) {
    using encoder = bai::base64_from_binary<bai::transform_width<string::const_iterator, 6, 8>>;
    string result(encoder(bytes.begin()), encoder(bytes.end()));
    result.append((3 - bytes.size() % 3) % 3, '=');
    return result;
}

string base64_decode(const string &text) {
    using decoder = bai::transform_width<bai::binary_from_base64<string::const_iterator>, 8, 6>;
    if (text.size() % 4 != 0)
        throw invalid_argument("base64 input length is not a multiple of 4");

    string input = text;
    size_t padding = 0;
    while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=')
        ++padding;
    // binary_from_base64 不认识 '='，用 'A'（值为 0）替换后再截掉多余的字节
    replace(input.end() - padding, input.end(), '=', 'A');

    try {
        string result(decoder(input.begin()), decoder(input.end()));
        result.erase(result.end() - padding, result.end());
        return result;
    } catch (bai::dataflow_exception &e) {
        throw invalid_argument(string("malformed base64 input: ") + e.what());
    }
}

}  // namespace sandbox
