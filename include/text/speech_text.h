#pragma once

/**
 * @file speech_text.h
 * @brief Reply text cleanup before synthesis
 */

#include <string>

namespace samaira {
namespace text {

/**
 * @brief Make a reply span speakable
 *
 * Strips markdown markers, spells out the rupee sign and common
 * abbreviations, singularizes lakhs/crores and collapses whitespace.
 * Only synthesis input goes through here; reply_token text is sent as-is.
 *
 * @return Prepared text; empty if nothing speakable remains
 */
std::string prepare_text_for_speech(const std::string& span);

} // namespace text
} // namespace samaira
