#include "EncodingName.hpp"
#include "StringUtils.hpp"
#include <string>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& alias_table() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"UTF-8",        "UTF-8"},
        {"UTF8",         "UTF-8"},
        {"U8",           "UTF-8"},
        {"UTF-16",       "UTF-16"},
        {"UTF16",        "UTF-16"},
        {"UTF-16LE",     "UTF-16LE"},
        {"UTF-16BE",     "UTF-16BE"},
        {"UTF-32",       "UTF-32"},
        {"UTF-32LE",     "UTF-32LE"},
        {"UTF-32BE",     "UTF-32BE"},
        {"ASCII",        "ASCII"},
        {"US-ASCII",     "ASCII"},
        {"LATIN-1",      "ISO-8859-1"},
        {"LATIN1",       "ISO-8859-1"},
        {"L1",           "ISO-8859-1"},
        {"ISO-8859-1",   "ISO-8859-1"},
        {"ISO8859-1",    "ISO-8859-1"},
        {"ISO_8859_1",   "ISO-8859-1"},
        {"CP1252",       "CP1252"},
        {"WINDOWS-1252", "CP1252"},
        {"CP1251",       "CP1251"},
        {"WINDOWS-1251", "CP1251"},
        {"CP1250",       "CP1250"},
        {"WINDOWS-1250", "CP1250"},
        {"GBK",          "GBK"},
        {"GB2312",       "GB2312"},
        {"GB18030",      "GB18030"},
        {"BIG5",         "BIG5"},
        {"SHIFT_JIS",    "SHIFT_JIS"},
        {"SJIS",         "SHIFT_JIS"},
        {"EUC-JP",       "EUC-JP"},
        {"EUC-KR",       "EUC-KR"},
        {"KOI8-R",       "KOI8-R"}
    };
    return aliases;
}

}

bool is_auto_encoding(const std::string& selector) {
    std::string s = selector;
    StringUtils::trim(s);
    return StringUtils::to_lower(s) == AUTO_ENCODING;
}

std::string to_iconv_name(const std::string& name) {
    std::string trimmed = name;
    StringUtils::trim(trimmed);

    std::string key = StringUtils::to_upper(trimmed);
    const auto& aliases = alias_table();
    auto it = aliases.find(key);
    if (it != aliases.end()) {
        return it->second;
    }

    // ICU reports visual-order EBCDIC Arabic/Hebrew as IBM420_rtl, IBM424_ltr, ...
    for (const char* suffix : {"_RTL", "_LTR"}) {
        const std::string sfx(suffix);
        if (key.size() > sfx.size() && key.compare(key.size() - sfx.size(), sfx.size(), sfx) == 0) {
            return trimmed.substr(0, trimmed.size() - sfx.size());
        }
    }

    return trimmed;
}
