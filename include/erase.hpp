#pragma once
#include <string>
#include <string_view>

namespace cryptowipe
{
/** @class Erase
 *  @brief Erase object provides a base class for the overwrite primitives
 */
class Erase
{
  public:
    /** @brief creates an erase object
     *  @param inDevPath the path of the key file or block device
     */
    explicit Erase(std::string_view inDevPath) : devPath(inDevPath)
    {}

    /* The path of the key file or block device */
    std::string devPath;
};

} // namespace cryptowipe
