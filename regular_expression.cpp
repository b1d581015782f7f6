/*
	explicit instantiations of the engine for narrow and wide characters,
	so users of the static library do not pay for them in every translation unit.
*/

#include "deepgrep/regular_expression.hpp"

namespace deepgrep {

namespace regex {

namespace impl {

template struct syntax_tree<char>;
template struct pattern_parser<char>;
template struct matcher<char>;
template class match_range<char>;
template struct compiled_pattern<char>;
template class pattern_cache<char>;

template struct syntax_tree<wchar_t>;
template struct pattern_parser<wchar_t>;
template struct matcher<wchar_t>;
template class match_range<wchar_t>;
template struct compiled_pattern<wchar_t>;
template class pattern_cache<wchar_t>;

} // namespace impl

template class engine<char>;
template class engine<wchar_t>;

} // namespace regex

} // namespace deepgrep
