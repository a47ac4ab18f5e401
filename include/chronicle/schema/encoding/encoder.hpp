#pragma once
#include <chronicle/schema/primitives.hpp>
#include <span>

namespace chronicle::schema::encoding {

// Row codec seam. The library is a build time choice made through the tag
// type; there is exactly one specialisation per codec and hot swapping is not
// a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const chronicle::schema::bytes_view_t& bytes);
};

}  // namespace chronicle::schema::encoding
