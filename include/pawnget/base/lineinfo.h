#pragma once

#include <pawnget/base/fmt.h>

#include <string>

namespace pawnget
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;

        std::string to_string() const;
    };
}

#define PAWNGET_LINE_INFO                                                                                              \
    pawnget::LineInfo { __LINE__, __FILE__ }

PAWNGET_FORMAT_WITH_TO_STRING(pawnget::LineInfo);
