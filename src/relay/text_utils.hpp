#pragma once

#include <string>
#include <string_view>

namespace text {

// True for the Chinese/English/CJK sentence punctuation stripped from transcripts.
bool is_transcript_punctuation(char32_t cp);

// Removes trailing punctuation; the rest of the string is untouched.
std::string strip_trailing_punctuation(std::string_view s);

// Removes punctuation anywhere in the string.
std::string strip_all_punctuation(std::string_view s);

} // namespace text
