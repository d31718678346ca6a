//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the XML rendering of validated programs.  Operand kinds become
// the `type` attribute and operand text becomes element content, with markup
// characters escaped.
//
//===----------------------------------------------------------------------===//

#include "ippx/io/XmlSerializer.hpp"

#include "ippx/io/StringEscape.hpp"

#include <sstream>

namespace ippx::io
{
namespace
{
using core::Instr;
using core::Operand;

/// @brief Emits indentation and line breaks according to the selected mode.
class Printer
{
  public:
    Printer(std::ostream &os, XmlSerializer::Mode mode) : os_(os), pretty_(mode == XmlSerializer::Mode::Pretty) {}

    void open(unsigned depth)
    {
        if (pretty_)
            os_ << std::string(depth, '\t');
    }

    void close()
    {
        if (pretty_)
            os_ << '\n';
    }

    std::ostream &os()
    {
        return os_;
    }

  private:
    std::ostream &os_;
    bool pretty_;
};

void writeOperand(Printer &pr, const Operand &operand, size_t index)
{
    pr.open(2);
    pr.os() << "<arg" << index << " type=\"" << core::toString(operand.kind) << "\">"
            << encodeXmlText(operand.text) << "</arg" << index << '>';
    pr.close();
}

void writeInstr(Printer &pr, const Instr &instr)
{
    pr.open(1);
    pr.os() << "<instruction order=\"" << instr.order << "\" opcode=\"" << instr.mnemonic() << '"';
    if (instr.operands.empty())
    {
        pr.os() << "/>";
        pr.close();
        return;
    }
    pr.os() << '>';
    pr.close();
    for (size_t i = 0; i < instr.operands.size(); ++i)
        writeOperand(pr, instr.operands[i], i + 1);
    pr.open(1);
    pr.os() << "</instruction>";
    pr.close();
}
} // namespace

void XmlSerializer::write(const core::Program &p, std::ostream &os, Mode mode)
{
    Printer pr(os, mode);
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

    pr.open(0);
    os << "<program language=\"" << encodeXmlText(p.language) << '"';
    if (p.instructions.empty())
    {
        os << "/>";
        pr.close();
        return;
    }
    os << '>';
    pr.close();
    for (const auto &instr : p.instructions)
        writeInstr(pr, instr);
    pr.open(0);
    os << "</program>";
    pr.close();
}

std::string XmlSerializer::toString(const core::Program &p, Mode mode)
{
    std::ostringstream os;
    write(p, os, mode);
    return os.str();
}

} // namespace ippx::io
