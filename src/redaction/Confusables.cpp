#include "Confusables.hpp"

namespace redaction
{

std::optional<char32_t> mapConfusable(char32_t cp) noexcept
{
    // Fullwidth forms (NFKC folds these already, kept for inputs that bypass it)
    if (cp >= U'０' && cp <= U'９')
        return static_cast<char32_t>(U'0' + (cp - U'０'));
    if (cp >= U'Ａ' && cp <= U'Ｚ')
        return static_cast<char32_t>(U'A' + (cp - U'Ａ'));
    if (cp >= U'ａ' && cp <= U'ｚ')
        return static_cast<char32_t>(U'a' + (cp - U'ａ'));

    switch (cp)
    {
    // Cyrillic lowercase
    case U'а': return U'a';
    case U'е': return U'e';
    case U'о': return U'o';
    case U'р': return U'p';
    case U'с': return U'c';
    case U'у': return U'y';
    case U'х': return U'x';
    case U'ѕ': return U's';
    case U'і': return U'i';
    case U'ј': return U'j';

    // Cyrillic uppercase
    case U'Ѕ': return U'S';
    case U'І': return U'I';
    case U'Ј': return U'J';
    case U'А': return U'A';
    case U'В': return U'B';
    case U'Е': return U'E';
    case U'К': return U'K';
    case U'М': return U'M';
    case U'Н': return U'H';
    case U'О': return U'O';
    case U'Р': return U'P';
    case U'С': return U'C';
    case U'Т': return U'T';
    case U'У': return U'Y';
    case U'Х': return U'X';

    // Greek lowercase
    case U'α': return U'a';
    case U'ο': return U'o';
    case U'ρ': return U'p';
    case U'τ': return U't';
    case U'υ': return U'u';

    // Greek uppercase
    case U'Α': return U'A';
    case U'Β': return U'B';
    case U'Ε': return U'E';
    case U'Ζ': return U'Z';
    case U'Η': return U'H';
    case U'Ι': return U'I';
    case U'Κ': return U'K';
    case U'Μ': return U'M';
    case U'Ν': return U'N';
    case U'Ο': return U'O';
    case U'Ρ': return U'P';
    case U'Τ': return U'T';
    case U'Υ': return U'Y';
    case U'Χ': return U'X';

    default:
        return std::nullopt;
    }
}

} // namespace redaction
