/// @file lilscript.hpp
/// @brief Umbrella header for the lilscript-cpp library.
///
/// Include this single header for access to all public types:
/// Span, Container, WordCount, Script, the TeX parser, the Markdown
/// renderer, conversion helpers, Error and logging. The nlohmann/json
/// export lives in <lilscript-cpp/json.hpp>.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/convert.hpp>
#include <lilscript-cpp/error.hpp>
#include <lilscript-cpp/log.hpp>
#include <lilscript-cpp/markdown.hpp>
#include <lilscript-cpp/script.hpp>
#include <lilscript-cpp/span.hpp>
#include <lilscript-cpp/tex.hpp>
#include <lilscript-cpp/word_count.hpp>
