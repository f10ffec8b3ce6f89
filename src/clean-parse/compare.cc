#include "compare.hh"

cp::compare_result cp::compare_no_case(text_view in, text_view pattern)
{
    auto it_in = in.elements().begin();
    auto it_pattern = pattern.elements().begin();
    for (; it_in != sentinel{} && it_pattern != sentinel{}; ++it_in, ++it_pattern)
        if (to_lower(*it_in) != to_lower(*it_pattern))
            return compare_result::mismatch;

    return in.size() >= pattern.size() ? compare_result::match : compare_result::incomplete;
}
