#include "allocate_error.hh"

#include <thin-node/assert.hh>

std::string tn::allocate_error::to_string() const
{
    switch (kind)
    {
    case allocate_error_kind::layout_overflow:
        return "layout overflow";
    case allocate_error_kind::out_of_memory:
        return "out of memory (requested " + std::to_string(requested.size) + " bytes, alignment "
             + std::to_string(requested.alignment) + ")";
    }

    return "unknown allocation error";
}

void tn::allocate_error::handle(tn::source_location location) const
{
    auto const message = "node allocation failed: " + to_string();
    tn::impl::handle_assert_failure("allocation", message.c_str(), location);
    TN_BREAK_AND_ABORT();
}
