#include <splice/patch/errors.h>

namespace splicer {

bool
operator==(patch_failure const& a, patch_failure const& b)
{
    return a.index == b.index && a.path == b.path && a.message == b.message;
}
bool
operator!=(patch_failure const& a, patch_failure const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, patch_failure const& f)
{
    s << "#" << f.index;
    if (!f.path.empty())
        s << " (" << f.path << ")";
    s << ": " << f.message;
    return s;
}

std::ostream&
operator<<(std::ostream& s, std::vector<patch_failure> const& failures)
{
    for (auto const& f : failures)
        s << "\n" << f;
    return s;
}

string
get_patch_error_message(boost::exception const& e)
{
    auto message = get_error_info<patch_error_message_info>(e);
    if (message)
        return *message;
    return boost::diagnostic_information(e);
}

} // namespace splicer
