#pragma once

/**
 * scriptlens
 *
 * Classification, structural validation, metadata extraction and
 * highlighting for short install/build scripts (shell, Python, Perl, Ruby).
 */

#include <lens/types.hpp>
#include <lens/result.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/script_classifier.hpp>
#include <lens/syntax_validator.hpp>
#include <lens/metadata_extractor.hpp>
#include <lens/highlighter.hpp>
#include <lens/stats_collector.hpp>
#include <lens/script_analyzer.hpp>
