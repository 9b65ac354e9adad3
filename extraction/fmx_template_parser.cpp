#include "fmx_template_parser.h"
#include "fmx_text_normalizer.h"
#include "fmx_log.h"
#include <map>

namespace fmx::extract {

fmx_string field_label(const fmx_field_config& field)
{
  fmx_string label = field.label.normalize_whitespace();
  return label.empty() ? field.name : label;
}

fmx_template_parser::fmx_template_parser(const fmx_token_model& tokens, const fmx_extraction_options& options)
  : tokens(tokens), options(options)
{
}

std::vector<size_t> fmx_template_parser::next_line_value(size_t line, const fmx_rect& label,
                                                         const fmx_label_set& labels,
                                                         const std::set<size_t>& consumed) const
{
  std::vector<size_t> result;
  if (line + 1 >= tokens.lines().size())
  {
    return result;
  }
  const std::vector<size_t>& l = tokens.lines()[line + 1];
  for (size_t p = 0; p < l.size(); ++p)
  {
    const fmx_rect& r = tokens.at(l[p]).rect;
    if (r.y0 - label.y1 > options.next_line_max_gap)
    {
      break;
    }
    if (r.x0 < label.x0 - options.next_line_alignment)
    {
      continue;
    }
    if (consumed.count(l[p]) > 0 || labels.match_at(tokens, l, p, consumed) > 0)
    {
      break;
    }
    result.push_back(l[p]);
  }
  return result;
}

std::vector<fmx_extraction_record> fmx_template_parser::parse(const std::vector<fmx_field_config>& fields,
                                                              fmx_page_extraction_context& ctx) const
{
  std::vector<fmx_extraction_record> result;
  fmx_label_set labels(true);
  for (const auto& field : fields)
  {
    labels.add(field_label(field));
  }
  if (labels.empty())
  {
    return result;
  }

  std::map<fmx_string, int> occurrences;
  std::set<size_t> done;

  for (size_t line = 0; line < tokens.lines().size(); ++line)
  {
    const std::vector<size_t>& l = tokens.lines()[line];
    size_t pos = 0;
    while (pos < l.size())
    {
      fmx_string label;
      size_t count = labels.match_at(tokens, l, pos, ctx.processed_indices, &label);
      if (count == 0)
      {
        ++pos;
        continue;
      }

      std::vector<size_t> label_tokens(l.begin() + pos, l.begin() + pos + count);
      fmx_rect label_rect = tokens.at(label_tokens.front()).rect;
      for (size_t idx : label_tokens) label_rect = label_rect.include(tokens.at(idx).rect);
      ctx.consume(label_tokens);

      int occurrence = occurrences[label]++;
      size_t field = fields.size();
      for (size_t f = 0; f < fields.size(); ++f)
      {
        if (done.count(f) == 0 && field_label(fields[f]) == label && fields[f].instance == occurrence)
        {
          field = f;
          break;
        }
      }
      pos += count;
      if (field == fields.size())
      {
        continue;
      }

      // same line up to the next declared label
      std::vector<size_t> value_tokens;
      while (pos < l.size())
      {
        size_t idx = l[pos];
        if (ctx.is_consumed(idx) || labels.match_at(tokens, l, pos, ctx.processed_indices) > 0 ||
            tokens.at(idx).rect.x0 - label_rect.x1 > options.max_same_line_distance)
        {
          break;
        }
        value_tokens.push_back(idx);
        ++pos;
      }

      std::vector<fmx_string> parts;
      for (size_t idx : value_tokens) parts.push_back(tokens.at(idx).text);
      fmx_string value = clean_value(fmx_string(" ").join(parts));
      if (value.empty())
      {
        value_tokens = next_line_value(line, label_rect, labels, ctx.processed_indices);
        parts.clear();
        for (size_t idx : value_tokens) parts.push_back(tokens.at(idx).text);
        value = clean_value(fmx_string(" ").join(parts));
      }

      const fmx_field_config& config = fields[field];
      if (config.field_type != fmx_field_type::text && !value.empty())
      {
        fmx_string narrowed = narrow_field(config.field_type, value);
        if (narrowed.empty())
        {
          log::info("Value '" + value + "' of " + config.name + " is no " + field_type_name(config.field_type));
        }
        value = narrowed;
      }

      if (value.empty() && !config.allow_empty)
      {
        continue;
      }

      fmx_rect rect = label_rect;
      if (!value.empty())
      {
        rect = tokens.at(value_tokens.front()).rect;
        for (size_t idx : value_tokens) rect = rect.include(tokens.at(idx).rect);
        ctx.consume(value_tokens);
      }
      done.insert(field);
      result.push_back(fmx_extraction_record(config.name, value, tokens.page(), rect, method::config_field));
    }
  }
  return result;
}

} // namespace fmx::extract
