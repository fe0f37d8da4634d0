/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "xc_dh.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace dhr::polar {

    namespace {

        struct XcDhEntry {
            const char* name;
            const char* xc_s;
            const char* xc_n; // nullptr: no non-consistent part
            double cc;
            double c_os;
            double c_ss;
        };

        constexpr std::array<XcDhEntry, 9> XC_DH_TABLE{{
            {"mp2", "HF", nullptr, 1.0, 1.0, 1.0},
            {"xyg3", "B3LYPg", "0.8033*HF - 0.0140*LDA + 0.2107*B88, 0.6789*LYP", 0.3211, 1.0, 1.0},
            {"xygjos", "B3LYPg", "0.7731*HF + 0.2269*LDA, 0.2309*VWN3 + 0.2754*LYP", 0.4364, 1.0, 0.0},
            {"xdhpbe0", "PBE0", "0.8335*HF + 0.1665*PBE, 0.5292*PBE", 0.5428, 1.0, 0.0},
            {"b2plyp", "0.53*HF + 0.47*B88, 0.73*LYP", nullptr, 0.27, 1.0, 1.0},
            {"mpw2plyp", "0.55*HF + 0.45*mPW91, 0.75*LYP", nullptr, 0.25, 1.0, 1.0},
            {"pbe0dh", "0.5*HF + 0.5*PBE, 0.875*PBE", nullptr, 0.125, 1.0, 1.0},
            {"pbeqidh", "0.693361*HF + 0.306639*PBE, 0.666667*PBE", nullptr, 0.333333, 1.0, 1.0},
            {"pbe02", "0.793701*HF + 0.206299*PBE, 0.5*PBE", nullptr, 0.5, 1.0, 1.0},
        }};

    } // namespace

    std::string normalize_xc_name(const std::string_view name) {
        std::string out;
        out.reserve(name.size());
        for (const char c : name) {
            if (c == '-' || c == '_')
                continue;
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::expected<XcDoublyHybrid, std::string> parse_xc_dh(const std::string_view name) {
        const std::string key = normalize_xc_name(name);
        const auto it = std::find_if(XC_DH_TABLE.begin(), XC_DH_TABLE.end(),
                                     [&](const XcDhEntry& e) { return key == e.name; });
        if (it == XC_DH_TABLE.end()) {
            return std::unexpected("Unknown doubly hybrid functional: '" + std::string(name) + "'");
        }

        XcDoublyHybrid xc;
        xc.name = it->name;
        xc.xc_s = it->xc_s;
        if (it->xc_n) {
            xc.xc_n = it->xc_n;
        }
        xc.cc = it->cc;
        xc.c_os = it->c_os;
        xc.c_ss = it->c_ss;
        return xc;
    }

    std::vector<std::string> known_xc_dh() {
        std::vector<std::string> names;
        for (const auto& e : XC_DH_TABLE) {
            names.emplace_back(e.name);
        }
        return names;
    }

} // namespace dhr::polar
