/** \file
 *
 * \brief Definition of Klondike::PileRef variant and the pile addressing
 */

#ifndef PILEREF_HH_
#define PILEREF_HH_

#include <compare>
#include <iosfwd>
#include <optional>
#include <variant>

namespace Klondike {

/** \brief Reference to the stock
 */
struct StockRef {
    /// \brief Three‐way comparison
    constexpr auto operator<=>(const StockRef&) const = default;
};

/** \brief Reference to a tableau pile
 */
struct TableauRef {
    int index;  ///< \brief Index of the tableau pile (0..6)

    /// \brief Three‐way comparison
    constexpr auto operator<=>(const TableauRef&) const = default;
};

/** \brief Reference to a foundation
 */
struct FoundationRef {
    int index;  ///< \brief Index of the foundation (0..3)

    /// \brief Three‐way comparison
    constexpr auto operator<=>(const FoundationRef&) const = default;
};

/** \brief Reference to a pile of the game
 *
 * A variant object identifying a pile by its kind and its index among the
 * piles of that kind.
 */
using PileRef = std::variant<StockRef, TableauRef, FoundationRef>;

/** \brief Integer addressing the stock
 */
constexpr auto STOCK_INDEX = -1;

/** \brief Flag set in the integers addressing the foundations
 *
 * Foundation n is addressed by <tt>FOUNDATION_FLAG | n</tt>, i.e. the
 * foundations are addressed by integers 16..19.
 */
constexpr auto FOUNDATION_FLAG = 0x10;

/** \brief Convert an integer address to a pile reference
 *
 * The integer addressing lets a single integer identify any pile:
 * - \ref STOCK_INDEX (-1) addresses the stock
 * - 0..6 address the tableau piles
 * - 16..19 (\ref FOUNDATION_FLAG set) address the foundations 0..3
 *
 * \param index the integer address
 *
 * \return the pile reference, or none if \p index does not address a pile
 *
 * \sa pileIndex()
 */
std::optional<PileRef> pileRefFromIndex(int index);

/** \brief Convert a pile reference to an integer address
 *
 * This function is the inverse of pileRefFromIndex().
 *
 * \param ref the pile reference
 *
 * \return the integer address of \p ref
 *
 * \throw std::invalid_argument if the index in \p ref is out of range
 */
int pileIndex(const PileRef& ref);

/** \brief Output a StockRef to stream
 *
 * \param os the output stream
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, StockRef);

/** \brief Output a TableauRef to stream
 *
 * \param os the output stream
 * \param ref the reference to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, TableauRef ref);

/** \brief Output a FoundationRef to stream
 *
 * \param os the output stream
 * \param ref the reference to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, FoundationRef ref);

}

#endif // PILEREF_HH_
