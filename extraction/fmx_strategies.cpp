#include "fmx_strategies.h"
#include "fmx_label_detector.h"
#include "fmx_value_associator.h"
#include "fmx_checkbox_resolver.h"
#include "fmx_table_normalizer.h"
#include "fmx_template_parser.h"
#include "fmx_text_normalizer.h"
#include <algorithm>

namespace fmx::extract {

namespace {

  fmx_string page_suffix(const fmx_page_view& page)
  {
    return " on page " + fmx_string(std::to_string(page.page_number));
  }

  // Reads form widgets. Checkboxes report "Checked" or nothing, radio
  // groups their selected option, the other widgets their value.
  class widget_strategy : public fmx_strategy {
  public:
    fmx_strategy_kind kind() const override { return fmx_strategy_kind::widget; }
    fmx_string name() const override { return "Widgets"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override
    {
      for (const auto& widget : page.source.widgets())
      {
        fmx_string raw_name = widget.field_name;
        fmx_string key = clean_key(raw_name.replace("_", " "));
        if (key.empty())
        {
          continue;
        }

        fmx_string value;
        bool off = widget.field_value.empty() || widget.field_value == "Off";
        switch (widget.field_type)
        {
          case fmx_widget_type::checkbox:
            value = off ? fmx_string() : fmx_string("Checked");
            break;
          case fmx_widget_type::radio:
            value = off ? fmx_string() : clean_value(widget.field_value).title_case();
            break;
          default:
            value = clean_value(widget.field_value);
            break;
        }
        if (value.empty())
        {
          continue;
        }

        out.push_back(fmx_extraction_record(key, value, page.page_number, widget.rect, method::widget));
        ctx.consume(page.tokens.tokens_in(widget.rect));
      }
    }
  };

  class table_strategy : public fmx_strategy {
  public:
    fmx_strategy_kind kind() const override { return fmx_strategy_kind::table; }
    fmx_string name() const override { return "Tables"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override
    {
      std::vector<fmx_table_grid> tables = page.source.tables();
      for (size_t i = 0; i < tables.size(); ++i)
      {
        std::vector<fmx_extraction_record> records =
          fmx_table_normalizer::normalize(tables[i], static_cast<int>(i + 1), page.page_number);
        if (records.empty())
        {
          continue;
        }
        out.insert(out.end(), records.begin(), records.end());
        ctx.consume(page.tokens.tokens_in(tables[i].bounds()));
      }
    }
  };

  // First unconsumed occurrence of a phrase, any case
  bool find_phrase(const fmx_token_model& tokens, const fmx_string& phrase, const std::set<size_t>& consumed,
                   fmx_label_match& out)
  {
    fmx_label_set set(false);
    set.add(phrase);
    for (const auto& line : tokens.lines())
    {
      for (size_t pos = 0; pos < line.size(); ++pos)
      {
        size_t count = set.match_at(tokens, line, pos, consumed);
        if (count == 0)
        {
          continue;
        }
        out.token_indices.assign(line.begin() + pos, line.begin() + pos + count);
        out.rect = tokens.at(line[pos]).rect;
        for (size_t idx : out.token_indices) out.rect = out.rect.include(tokens.at(idx).rect);
        out.text = phrase;
        return true;
      }
    }
    return false;
  }

  // Options of a dictionary group found as words on the page, each
  // resolved by the checkbox resolver. A group needs at least two of its
  // options on the page and a checkbox for one of them; otherwise its
  // words are left to the label matchers.
  class checkbox_group_strategy : public fmx_strategy {
    const fmx_extraction_setup& setup;

  public:
    explicit checkbox_group_strategy(const fmx_extraction_setup& setup) : setup(setup) {}

    fmx_strategy_kind kind() const override { return fmx_strategy_kind::checkbox_group; }
    fmx_string name() const override { return "Checkbox Groups"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override
    {
      fmx_checkbox_resolver resolver(page.source, page.tokens, setup.options);
      for (const auto& group : setup.dictionary.checkbox_groups)
      {
        std::vector<fmx_label_match> found;
        for (const auto& option : group.options)
        {
          fmx_label_match match;
          if (find_phrase(page.tokens, option, ctx.processed_indices, match))
          {
            found.push_back(match);
          }
        }
        if (found.size() < 2)
        {
          continue;
        }

        // resolved on a copy, so words of a group without any checkbox stay free
        std::set<size_t> consumed = ctx.processed_indices;
        std::vector<fmx_rect> rects;
        for (const auto& match : found)
        {
          rects.push_back(match.rect);
          consumed.insert(match.token_indices.begin(), match.token_indices.end());
        }
        std::vector<fmx_checkbox_result> states = resolver.resolve_group(rects, consumed);
        bool any_box = false;
        for (const auto& s : states)
        {
          any_box = any_box || s.state != fmx_checkbox_state::not_found;
        }
        if (!any_box)
        {
          continue;
        }

        ctx.processed_indices = consumed;
        for (size_t i = 0; i < found.size(); ++i)
        {
          if (states[i].state == fmx_checkbox_state::not_found)
          {
            continue;
          }
          out.push_back(fmx_extraction_record(clean_key(found[i].text), checkbox_state_name(states[i].state),
                                              page.page_number, states[i].rect, method::checkbox_option));
        }
      }
    }
  };

  // Compound, colon and standalone labels share the scan: find a label,
  // associate its value, record both and consume their tokens
  class label_strategy : public fmx_strategy {
    const fmx_extraction_setup& setup;
    fmx_strategy_kind strategy_kind;

    bool label_at(const fmx_label_detector& detector, size_t line, size_t pos,
                  const fmx_page_extraction_context& ctx, fmx_label_match& out) const
    {
      switch (strategy_kind)
      {
        case fmx_strategy_kind::compound_label: return detector.compound_at(line, pos, ctx, out);
        case fmx_strategy_kind::colon_label: return detector.colon_at(line, pos, ctx, out);
        default: return detector.standalone_at(line, pos, ctx, out);
      }
    }

    const char* record_method() const
    {
      switch (strategy_kind)
      {
        case fmx_strategy_kind::compound_label: return method::compound_label;
        case fmx_strategy_kind::colon_label: return method::form_field;
        default: return method::label_match;
      }
    }

  public:
    label_strategy(const fmx_extraction_setup& setup, fmx_strategy_kind kind)
      : setup(setup), strategy_kind(kind) {}

    fmx_strategy_kind kind() const override { return strategy_kind; }

    fmx_string name() const override
    {
      switch (strategy_kind)
      {
        case fmx_strategy_kind::compound_label: return "Compound Labels";
        case fmx_strategy_kind::colon_label: return "Colon Labels";
        default: return "Standalone Labels";
      }
    }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override
    {
      fmx_label_detector detector(page.tokens, setup.dictionary, setup.options);
      fmx_value_associator associator(page.tokens, detector, setup.options);

      for (size_t line = 0; line < page.tokens.lines().size(); ++line)
      {
        size_t pos = 0;
        while (pos < page.tokens.lines()[line].size())
        {
          fmx_label_match label;
          if (!label_at(detector, line, pos, ctx, label))
          {
            ++pos;
            continue;
          }
          // colon labels end at pos, the others start there
          const std::vector<size_t>& l = page.tokens.lines()[line];
          pos = std::find(l.begin(), l.end(), label.token_indices.back()) - l.begin() + 1;

          fmx_string key = clean_key(label.text);
          ctx.consume(label.token_indices);
          if (key.empty() || ctx.has_key(key))
          {
            continue;
          }

          fmx_value_span value = associator.associate(label, ctx.processed_indices);
          if (value.empty())
          {
            continue;
          }
          out.push_back(fmx_extraction_record(key, value.text, page.page_number, value.rect, record_method()));
          ctx.consume(value.token_indices);
        }
      }
    }
  };

  class template_field_strategy : public fmx_strategy {
    const fmx_extraction_setup& setup;

  public:
    explicit template_field_strategy(const fmx_extraction_setup& setup) : setup(setup) {}

    fmx_strategy_kind kind() const override { return fmx_strategy_kind::template_field; }
    fmx_string name() const override { return "Template Fields"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>& warnings) const override
    {
      if (setup.form == nullptr)
      {
        throw fmx_strategy_exception(name(), "no form template");
      }

      std::vector<fmx_field_config> fields;
      for (const auto& field : setup.form->fields)
      {
        if (field.page_num == page.page_number) fields.push_back(field);
      }
      if (fields.empty())
      {
        return;
      }

      fmx_template_parser parser(page.tokens, setup.options);
      std::vector<fmx_extraction_record> records = parser.parse(fields, ctx);
      for (const auto& field : fields)
      {
        if (!field.required)
        {
          continue;
        }
        bool present = false;
        for (const auto& record : records)
        {
          present = present || record.key == field.name;
        }
        if (!present)
        {
          warnings.push_back("Required field '" + field.name + "' not found" + page_suffix(page));
        }
      }
      out.insert(out.end(), records.begin(), records.end());
    }
  };

  // Template checkboxes: the n-th occurrence of the label, resolved
  // together so no glyph serves two checkboxes
  class config_checkbox_strategy : public fmx_strategy {
    const fmx_extraction_setup& setup;

  public:
    explicit config_checkbox_strategy(const fmx_extraction_setup& setup) : setup(setup) {}

    fmx_strategy_kind kind() const override { return fmx_strategy_kind::config_checkbox; }
    fmx_string name() const override { return "Config Checkboxes"; }

    void extract(const fmx_page_view& page, fmx_page_extraction_context& ctx,
                 std::vector<fmx_extraction_record>& out, std::vector<fmx_string>&) const override
    {
      if (setup.form == nullptr)
      {
        throw fmx_strategy_exception(name(), "no form template");
      }

      std::vector<const fmx_checkbox_config*> found;
      std::vector<fmx_rect> rects;
      for (const auto& checkbox : setup.form->checkboxes)
      {
        if (checkbox.page_num != page.page_number || checkbox.instance < 0)
        {
          continue;
        }
        fmx_string label = checkbox.label.empty() ? checkbox.name : checkbox.label;
        std::vector<fmx_rect> occurrences = page.source.search_text(label);
        if (occurrences.size() <= static_cast<size_t>(checkbox.instance))
        {
          continue;
        }
        found.push_back(&checkbox);
        rects.push_back(occurrences[checkbox.instance]);
      }
      if (found.empty())
      {
        return;
      }

      for (const auto& rect : rects)
      {
        ctx.consume(page.tokens.tokens_in(rect));
      }
      fmx_checkbox_resolver resolver(page.source, page.tokens, setup.options);
      std::vector<fmx_checkbox_result> states = resolver.resolve_group(rects, ctx.processed_indices);
      for (size_t i = 0; i < found.size(); ++i)
      {
        if (states[i].state == fmx_checkbox_state::not_found)
        {
          continue;
        }
        out.push_back(fmx_extraction_record(found[i]->name, checkbox_state_name(states[i].state),
                                            page.page_number, states[i].rect, method::config_checkbox));
      }
    }
  };

}

std::unique_ptr<fmx_strategy> make_strategy(fmx_strategy_kind kind, const fmx_extraction_setup& setup)
{
  switch (kind)
  {
    case fmx_strategy_kind::widget: return std::make_unique<widget_strategy>();
    case fmx_strategy_kind::table: return std::make_unique<table_strategy>();
    case fmx_strategy_kind::checkbox_group: return std::make_unique<checkbox_group_strategy>(setup);
    case fmx_strategy_kind::compound_label:
    case fmx_strategy_kind::colon_label:
    case fmx_strategy_kind::standalone_label: return std::make_unique<label_strategy>(setup, kind);
    case fmx_strategy_kind::template_field: return std::make_unique<template_field_strategy>(setup);
    case fmx_strategy_kind::config_checkbox: return std::make_unique<config_checkbox_strategy>(setup);
  }
  throw fmx_strategy_exception("make_strategy", "unknown strategy kind");
}

std::vector<fmx_strategy_kind> heuristic_strategies()
{
  return {
    fmx_strategy_kind::widget,
    fmx_strategy_kind::table,
    fmx_strategy_kind::checkbox_group,
    fmx_strategy_kind::compound_label,
    fmx_strategy_kind::colon_label,
    fmx_strategy_kind::standalone_label
  };
}

std::vector<fmx_strategy_kind> config_strategies()
{
  return {
    fmx_strategy_kind::template_field,
    fmx_strategy_kind::config_checkbox
  };
}

} // namespace fmx::extract
