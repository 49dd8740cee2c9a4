#pragma once

namespace pawnget
{
    struct LocalizedString;

    struct Unit;
    struct ExpectedLeftTag;
    struct ExpectedRightTag;

    template<class T, class Error>
    struct ExpectedT;

    template<class T>
    using ExpectedL = ExpectedT<T, LocalizedString>;
}
