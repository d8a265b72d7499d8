#include "LocaleManager.hpp"
#include "TextIO.hpp"
#include <iostream>
#include <stdexcept>

namespace {
    // This static variable holds the current locale for the entire application.
    // It's initialized to the default "C" locale.
    std::locale g_current_locale("C");
}

namespace LocaleManager {

    bool set_current_locale(const std::string& locale_name) {
        try {
            g_current_locale = std::locale(locale_name.c_str());
            std::cout.imbue(g_current_locale);
            return true;
        }
        catch (const std::runtime_error&) {
            TextIO::print("Warning: Invalid or unsupported locale name '" + locale_name + "'\n");
            return false;
        }
    }

    const std::locale& get_current_locale() {
        return g_current_locale;
    }
}
