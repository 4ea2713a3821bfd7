#include "klondike/PileRef.hh"

#include "klondike/KlondikeConstants.hh"

#include <ostream>
#include <stdexcept>

namespace Klondike {

namespace {

struct PileIndexVisitor {
    int operator()(StockRef) const
    {
        return STOCK_INDEX;
    }

    int operator()(const TableauRef ref) const
    {
        if (ref.index < 0 || ref.index >= N_TABLEAU_PILES) {
            throw std::invalid_argument {"Invalid tableau pile"};
        }
        return ref.index;
    }

    int operator()(const FoundationRef ref) const
    {
        if (ref.index < 0 || ref.index >= N_FOUNDATIONS) {
            throw std::invalid_argument {"Invalid foundation"};
        }
        return FOUNDATION_FLAG | ref.index;
    }
};

}

std::optional<PileRef> pileRefFromIndex(const int index)
{
    if (index == STOCK_INDEX) {
        return StockRef {};
    }
    if (index >= 0 && (index ^ FOUNDATION_FLAG) < FOUNDATION_FLAG) {
        const auto n = index & 0xF;
        if (n < N_FOUNDATIONS) {
            return FoundationRef {n};
        }
    } else if (0 <= index && index < N_TABLEAU_PILES) {
        return TableauRef {index};
    }
    return std::nullopt;
}

int pileIndex(const PileRef& ref)
{
    return std::visit(PileIndexVisitor {}, ref);
}

std::ostream& operator<<(std::ostream& os, StockRef)
{
    return os << "stock";
}

std::ostream& operator<<(std::ostream& os, const TableauRef ref)
{
    return os << "tableau " << ref.index;
}

std::ostream& operator<<(std::ostream& os, const FoundationRef ref)
{
    return os << "foundation " << ref.index;
}

}
