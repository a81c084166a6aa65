#include "plx_pdf_content_reader.h"
#include "../layout/plx_layout_page.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include <utf8cpp/utf8.h>
#include <podofo/auxiliary/StateStack.h>

using namespace std;
using namespace PoDoFo;

// A TJ displacement of more than this (in thousandths of an em) is a word gap
constexpr double TJ_SPACE_THRESHOLD = 200.0;

// 5.2 Text State Parameters and Operators
// 5.3 Text Objects
struct plx_pdf_content_reader::text_state
{
  plx_matrix CTM = plx_identity_matrix();
  plx_matrix T_m = plx_identity_matrix();
  plx_matrix T_lm = plx_identity_matrix();
  double T_l = 0;     // leading
  double T_rise = 0;  // rise
  PdfTextState PdfState;
  plx_color fill;
};

struct plx_pdf_content_reader::read_context
{
  read_context(const PdfPage& page, plx_page_content& content, double default_font_size);

  void BT_Operator();
  void Tf_Operator(const PdfName& fontname, double fontsize);
  void cm_Operator(const plx_matrix& m);
  void Tm_Operator(const plx_matrix& m);
  void TdTD_Operator(double tx, double ty);
  void TStar_Operator();
  void q_Operator();
  void Q_Operator();

  // Starts a run at the current text position
  void begin_run();
  // Appends a string shown with the current state to the open run
  void show_string(const PdfString& str);
  // TJ displacement in thousandths of an em
  void displace(double value);
  void end_run();

  // Page coordinates relative to the media box origin
  plx_matrix to_page(const plx_matrix& m) const;

  const PdfPage& m_page;
  plx_page_content& m_content;
  double m_origin_x;
  double m_origin_y;
  double m_default_font_size;
  StateStack<text_state> States;

  bool m_run_open = false;
  plx_text_run m_run;
  double m_run_advance = 0;
  plx_matrix m_run_scale = plx_identity_matrix();
};

namespace {

  void read(const PdfVariantStack& stack, double& tx, double& ty)
  {
    tx = stack[1].GetReal();
    ty = stack[0].GetReal();
  }

  plx_matrix read_matrix(const PdfVariantStack& stack)
  {
    return plx_matrix{
      stack[5].GetReal(),
      stack[4].GetReal(),
      stack[3].GetReal(),
      stack[2].GetReal(),
      stack[1].GetReal(),
      stack[0].GetReal()
    };
  }

  plx_matrix translation(double tx, double ty)
  {
    return plx_matrix{1.0, 0.0, 0.0, 1.0, tx, ty};
  }

  std::string sanitize_utf8(const std::string& text)
  {
    std::string out;
    out.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(out));
    return out;
  }

  bool all_numbers(const PdfVariantStack& stack)
  {
    for (unsigned i = 0; i < stack.size(); i++) {
      if (!stack[i].IsNumberOrReal()) {
        return false;
      }
    }
    return true;
  }

  // Gray, RGB or CMYK operands as an approximate RGB color
  bool read_fill_color(const PdfVariantStack& stack, plx_color& color)
  {
    if (!all_numbers(stack)) {
      return false;
    }
    switch (stack.size()) {
      case 1:
      {
        double gray = stack[0].GetReal();
        color = plx_color{gray, gray, gray};
        return true;
      }
      case 3:
        color = plx_color{stack[2].GetReal(), stack[1].GetReal(), stack[0].GetReal()};
        return true;
      case 4:
      {
        double c = stack[3].GetReal();
        double m = stack[2].GetReal();
        double y = stack[1].GetReal();
        double k = stack[0].GetReal();
        color = plx_color{(1 - c) * (1 - k), (1 - m) * (1 - k), (1 - y) * (1 - k)};
        return true;
      }
      default:
        return false;
    }
  }

} // namespace

plx_pdf_content_reader::read_context::read_context(const PdfPage& page, plx_page_content& content,
                                                   double default_font_size)
  : m_page(page),
    m_content(content),
    m_origin_x(page.GetRect().X),
    m_origin_y(page.GetRect().Y),
    m_default_font_size(default_font_size)
{
  States.Push();
}

void plx_pdf_content_reader::read_context::BT_Operator()
{
  States.Current->T_m = plx_identity_matrix();
  States.Current->T_lm = plx_identity_matrix();
}

void plx_pdf_content_reader::read_context::Tf_Operator(const PdfName& fontname, double fontsize)
{
  States.Current->PdfState.FontSize = fontsize;

  try {
    auto resources = m_page.GetResources();
    States.Current->PdfState.Font = resources.GetFont(fontname);
  } catch (const std::exception& e) {
    std::cerr << "Warning: font " << std::string(fontname.GetString()) << " not loadable: " << e.what() << std::endl;
    States.Current->PdfState.Font = nullptr;
  }
}

void plx_pdf_content_reader::read_context::cm_Operator(const plx_matrix& m)
{
  States.Current->CTM = plx_coords::multiply(m, States.Current->CTM);

  plx_content_operator op;
  op.kind = plx_content_operator::set_transform;
  op.operands = to_page(States.Current->CTM);
  m_content.trace.push_back(op);
}

void plx_pdf_content_reader::read_context::Tm_Operator(const plx_matrix& m)
{
  States.Current->T_m = m;
  States.Current->T_lm = m;
}

void plx_pdf_content_reader::read_context::TdTD_Operator(double tx, double ty)
{
  States.Current->T_lm = plx_coords::multiply(translation(tx, ty), States.Current->T_lm);
  States.Current->T_m = States.Current->T_lm;
}

void plx_pdf_content_reader::read_context::TStar_Operator()
{
  TdTD_Operator(0, -States.Current->T_l);
}

void plx_pdf_content_reader::read_context::q_Operator()
{
  States.Push();

  plx_content_operator op;
  op.kind = plx_content_operator::save_state;
  m_content.trace.push_back(op);
}

void plx_pdf_content_reader::read_context::Q_Operator()
{
  // unbalanced Q in broken files
  if (States.GetSize() > 1) {
    States.Pop();
  }

  plx_content_operator op;
  op.kind = plx_content_operator::restore_state;
  m_content.trace.push_back(op);

  // The restored CTM is in effect for everything painted after the Q
  plx_content_operator restored;
  restored.kind = plx_content_operator::set_transform;
  restored.operands = to_page(States.Current->CTM);
  m_content.trace.push_back(restored);
}

void plx_pdf_content_reader::read_context::begin_run()
{
  const text_state& state = *States.Current;
  double font_size = state.PdfState.FontSize > 0 ? state.PdfState.FontSize : m_default_font_size;

  // Text rendering matrix: [Tfs*Th 0 0 Tfs 0 Trise] x Tm x CTM
  plx_matrix params{font_size * state.PdfState.FontScale, 0.0, 0.0, font_size, 0.0, state.T_rise};
  plx_matrix device = plx_coords::multiply(state.T_m, state.CTM);

  m_run = plx_text_run();
  m_run.transform = to_page(plx_coords::multiply(params, device));
  m_run.font_size = font_size;
  m_run.color = state.fill;
  m_run.height = font_size * std::hypot(device[2], device[3]);
  m_run_scale = device;
  m_run_advance = 0;

  if (state.PdfState.Font != nullptr) {
    try {
      std::string font_name = state.PdfState.Font->GetName();
      size_t plus_pos = font_name.find('+');
      if (plus_pos != string::npos) {
        font_name = font_name.substr(plus_pos + 1);
      }
      m_run.font_name = font_name;
    } catch (const std::exception& e) {
      std::cerr << "Warning: Failed to extract font name: " << e.what() << std::endl;
    }
  }
  m_run_open = true;
}

void plx_pdf_content_reader::read_context::show_string(const PdfString& str)
{
  text_state& state = *States.Current;
  std::string decoded;
  std::vector<double> lengths;
  std::vector<unsigned> positions;
  double advance = 0;

  if (state.PdfState.Font != nullptr) {
    if (!state.PdfState.Font->TryScanEncodedString(str, state.PdfState, decoded, lengths, positions)) {
      std::cerr << "Warning: string partially decoded with font "
                << state.PdfState.Font->GetName() << std::endl;
    }
    for (double length : lengths) {
      advance += length;
    }
  } else {
    // Without a font only the raw bytes and a rough advance are available
    decoded = str.GetString();
    double font_size = state.PdfState.FontSize > 0 ? state.PdfState.FontSize : m_default_font_size;
    advance = decoded.size() * font_size * 0.5 * state.PdfState.FontScale;
  }

  m_run.text += sanitize_utf8(decoded);
  m_run_advance += advance;
  state.T_m = plx_coords::multiply(translation(advance, 0), state.T_m);
}

void plx_pdf_content_reader::read_context::displace(double value)
{
  text_state& state = *States.Current;
  double font_size = state.PdfState.FontSize > 0 ? state.PdfState.FontSize : m_default_font_size;
  double t_j = -value / 1000.0 * font_size * state.PdfState.FontScale;
  state.T_m = plx_coords::multiply(translation(t_j, 0), state.T_m);
  m_run_advance += t_j;

  if (-value > TJ_SPACE_THRESHOLD && !m_run.text.empty() && m_run.text.back() != ' ') {
    m_run.text += ' ';
  }
}

void plx_pdf_content_reader::read_context::end_run()
{
  if (!m_run_open) {
    return;
  }
  m_run_open = false;

  m_run.width = std::max(0.0, m_run_advance) * std::hypot(m_run_scale[0], m_run_scale[1]);
  if (!m_run.text.empty()) {
    m_content.runs.push_back(m_run);
  }

  plx_content_operator op;
  op.kind = plx_content_operator::paint_text;
  m_content.trace.push_back(op);
}

plx_matrix plx_pdf_content_reader::read_context::to_page(const plx_matrix& m) const
{
  plx_matrix result = m;
  result[4] -= m_origin_x;
  result[5] -= m_origin_y;
  return result;
}

plx_pdf_content_reader::plx_pdf_content_reader(PdfMemDocument& document, double default_font_size)
  : m_document(document),
    m_default_font_size(default_font_size > 0 ? default_font_size : 12.0),
    m_current_page(0)
{
}

size_t plx_pdf_content_reader::page_count() const
{
  return m_document.GetPages().GetCount();
}

plx_page_content plx_pdf_content_reader::read_page(size_t page_index)
{
  auto& page = m_document.GetPages().GetPageAt(static_cast<unsigned>(page_index));

  plx_page_content content;
  Rect rect = page.GetRect();
  content.width = rect.Width;
  content.height = rect.Height;
  content.rotation = plx_normalize_rotation(page.GetRotationRaw());

  m_images.clear();
  m_current_page = page_index;

  read_context context(page, content, m_default_font_size);

  PdfContentReaderArgs args;
  args.Flags = PdfContentReaderFlags::None;

  PdfContentStreamReader reader(page, args);
  PdfContent item;

  while (reader.TryReadNext(item))
  {
    switch (item.Type)
    {
      case PdfContentType::Operator:
      {
        if (item.Warnings != PdfContentWarnings::None)
        {
          // Ignore invalid operators
          continue;
        }

        switch (item.Operator)
        {
          case PdfOperator::cm:
            context.cm_Operator(read_matrix(item.Stack));
            break;
          case PdfOperator::q:
            context.q_Operator();
            break;
          case PdfOperator::Q:
            context.Q_Operator();
            break;
          case PdfOperator::BT:
            context.BT_Operator();
            break;
          case PdfOperator::ET:
            break;
          case PdfOperator::Tf:
          {
            double fontSize = item.Stack[0].GetReal();
            const PdfName& fontName = item.Stack[1].GetName();
            context.Tf_Operator(fontName, fontSize);
            break;
          }
          case PdfOperator::Tm:
            context.Tm_Operator(read_matrix(item.Stack));
            break;
          case PdfOperator::Td:
          case PdfOperator::TD:
          {
            double tx, ty;
            read(item.Stack, tx, ty);
            context.TdTD_Operator(tx, ty);
            if (item.Operator == PdfOperator::TD)
              context.States.Current->T_l = -ty;
            break;
          }
          case PdfOperator::T_Star:
            context.TStar_Operator();
            break;
          case PdfOperator::TL:
            context.States.Current->T_l = item.Stack[0].GetReal();
            break;
          case PdfOperator::Tc:
            context.States.Current->PdfState.CharSpacing = item.Stack[0].GetReal();
            break;
          case PdfOperator::Tw:
            context.States.Current->PdfState.WordSpacing = item.Stack[0].GetReal();
            break;
          case PdfOperator::Tz:
            context.States.Current->PdfState.FontScale = item.Stack[0].GetReal() / 100.0;
            break;
          case PdfOperator::Ts:
            context.States.Current->T_rise = item.Stack[0].GetReal();
            break;
          case PdfOperator::g:
          case PdfOperator::rg:
          case PdfOperator::k:
          case PdfOperator::sc:
          case PdfOperator::scn:
          {
            plx_color color;
            if (read_fill_color(item.Stack, color))
              context.States.Current->fill = color;
            break;
          }
          case PdfOperator::Tj:
          case PdfOperator::Quote:
          case PdfOperator::DoubleQuote:
          {
            if (item.Operator == PdfOperator::Quote)
            {
              context.TStar_Operator();
            }
            else if (item.Operator == PdfOperator::DoubleQuote)
            {
              context.States.Current->PdfState.WordSpacing = item.Stack[2].GetReal();
              context.States.Current->PdfState.CharSpacing = item.Stack[1].GetReal();
              context.TStar_Operator();
            }

            context.begin_run();
            context.show_string(item.Stack[0].GetString());
            context.end_run();
            break;
          }
          case PdfOperator::TJ:
          {
            const PdfArray& arr = item.Stack[0].GetArray();
            context.begin_run();
            for (unsigned i = 0; i < arr.size(); i++)
            {
              const PdfObject& entry = arr[i];
              if (entry.IsString())
                context.show_string(entry.GetString());
              else if (entry.IsNumberOrReal())
                context.displace(entry.GetReal());
            }
            context.end_run();
            break;
          }
          default:
            break;
        }
        break;
      }
      case PdfContentType::DoXObject:
      {
        if (item.XObject != nullptr && item.XObject->GetType() != PdfXObjectType::Image)
        {
          // Forms are entered through BeginFormXObject
          break;
        }

        plx_content_operator op;
        op.kind = plx_content_operator::paint_image;
        if (item.Stack.size() > 0 && item.Stack[0].IsName())
          op.name = std::string(item.Stack[0].GetName().GetString());
        op.resource_index = m_images.size();
        m_images.push_back(item.XObject);
        content.trace.push_back(op);
        break;
      }
      case PdfContentType::BeginFormXObject:
        context.q_Operator();
        break;
      case PdfContentType::EndFormXObject:
        context.Q_Operator();
        break;
      case PdfContentType::ImageDictionary:
      case PdfContentType::ImageData:
      default:
        // inline images are not extracted
        break;
    }
  }

  return content;
}

plx_raster plx_pdf_content_reader::resolve_image(size_t page_index, const plx_content_operator& op)
{
  if (page_index != m_current_page || op.resource_index >= m_images.size())
  {
    throw std::runtime_error("image " + op.name + " does not belong to the current page");
  }

  const auto& xobject = m_images[op.resource_index];
  if (xobject == nullptr)
  {
    throw std::runtime_error("image " + op.name + " could not be resolved");
  }

  const PdfImage* image = dynamic_cast<const PdfImage*>(xobject.get());
  if (image == nullptr)
  {
    throw std::runtime_error(op.name + " is not an image");
  }

  plx_raster raster;
  raster.width = static_cast<int>(image->GetWidth());
  raster.height = static_cast<int>(image->GetHeight());
  raster.channels = 3;

  charbuff buffer;
  image->DecodeTo(buffer, PdfPixelFormat::BGR24, raster.width * 3);
  raster.pixels.assign(buffer.data(), buffer.size());
  return raster;
}
