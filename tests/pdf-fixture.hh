/* Copyright © 2026 pdf2extract authors
 *
 * This file is part of pdf2extract.
 *
 * pdf2extract is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdf2extract is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#ifndef PDF2EXTRACT_TESTS_PDF_FIXTURE_HH
#define PDF2EXTRACT_TESTS_PDF_FIXTURE_HH

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

/* Minimal PDF writer for building test documents in memory. */

namespace fixture
{

  class PdfWriter
  {
  protected:
    std::vector<std::string> objects;
  public:
    /* Returns the number of a new, still empty object. */
    int reserve()
    {
      this->objects.push_back("");
      return static_cast<int>(this->objects.size());
    }

    void set(int n, const std::string &body)
    {
      this->objects[n - 1] = body;
    }

    int add(const std::string &body)
    {
      int n = this->reserve();
      this->set(n, body);
      return n;
    }

    /* `dict` holds the dictionary entries other than /Length. */
    int add_stream(const std::string &dict, const std::string &data)
    {
      std::ostringstream body;
      body << "<< " << dict << " /Length " << data.size() << " >>\nstream\n" << data << "\nendstream";
      return this->add(body.str());
    }

    std::string finish(int root) const
    {
      std::ostringstream out;
      out << "%PDF-1.4\n";
      std::vector<std::streamoff> offsets;
      for (size_t i = 0; i < this->objects.size(); i++)
      {
        offsets.push_back(out.tellp());
        out << (i + 1) << " 0 obj\n" << this->objects[i] << "\nendobj\n";
      }
      std::streamoff xref_offset = out.tellp();
      out << "xref\n0 " << (this->objects.size() + 1) << "\n";
      out << "0000000000 65535 f \n";
      for (std::streamoff offset : offsets)
        out << std::setw(10) << std::setfill('0') << offset << " 00000 n \n";
      out
        << "trailer\n<< /Size " << (this->objects.size() + 1) << " /Root " << root << " 0 R >>\n"
        << "startxref\n" << xref_offset << "\n%%EOF\n";
      return out.str();
    }
  };

  static inline std::string ref(int n)
  {
    std::ostringstream stream;
    stream << n << " 0 R";
    return stream.str();
  }

  /* A page of the test document: its content stream, and whether it uses
   * the shared image XObject /Im1.
   */
  class Page
  {
  public:
    std::string content;
    bool uses_image;
    explicit Page(const std::string &content, bool uses_image = false)
    : content(content), uses_image(uses_image)
    { }
  };

  /* Every page is 200x300 points; text is set in Helvetica (/F1).
   * /Im1 is a 2x2 RGB image: red, green / blue, white.
   */
  static inline std::string make_document(const std::vector<Page> &pages)
  {
    PdfWriter writer;
    int catalog = writer.reserve();
    int page_tree = writer.reserve();
    int font = writer.add("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    int image = writer.add_stream(
      "/Type /XObject /Subtype /Image /Width 2 /Height 2 /ColorSpace /DeviceRGB /BitsPerComponent 8 /Filter /ASCIIHexDecode",
      "FF0000 00FF00\n0000FF FFFFFF>"
    );
    std::ostringstream kids;
    for (const Page &page : pages)
    {
      int content = writer.add_stream("", page.content);
      std::ostringstream resources;
      resources << "<< /Font << /F1 " << ref(font) << " >>";
      if (page.uses_image)
        resources << " /XObject << /Im1 " << ref(image) << " >>";
      resources << " >>";
      std::ostringstream body;
      body
        << "<< /Type /Page /Parent " << ref(page_tree)
        << " /MediaBox [0 0 200 300] /Resources " << resources.str()
        << " /Contents " << ref(content) << " >>";
      kids << ref(writer.add(body.str())) << " ";
    }
    std::ostringstream tree;
    tree << "<< /Type /Pages /Kids [ " << kids.str() << "] /Count " << pages.size() << " >>";
    writer.set(page_tree, tree.str());
    writer.set(catalog, "<< /Type /Catalog /Pages " + ref(page_tree) + " >>");
    return writer.finish(catalog);
  }

  static inline std::string text(const std::string &s, int x = 20, int y = 260)
  {
    std::ostringstream stream;
    stream << "BT /F1 18 Tf " << x << " " << y << " Td (" << s << ") Tj ET\n";
    return stream.str();
  }

}

#endif

// vim:ts=2 sts=2 sw=2 et
