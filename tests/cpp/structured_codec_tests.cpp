#include <gtest/gtest.h>
#include "graphconv/core/error.hpp"
#include "graphconv/core/structured_codec.hpp"
#include "test_utils.hpp"

using namespace graphconv::core;
using namespace graphconv::core::test;

namespace {
AttrMap weight_cost(double w, std::int64_t c) {
  return AttrMap{{"weight", AttrValue{w}}, {"cost", AttrValue{c}}};
}
} // namespace

TEST(StructuredMatrix, ZeroInitialisedPerKind) {
  StructuredMatrix m(2, 2, {FieldSpec{"flag", ElementKind::Bool}, FieldSpec{"n", ElementKind::Int},
                            FieldSpec{"x", ElementKind::Float}, FieldSpec{"z", ElementKind::Complex}});
  auto rec = m.record(1, 0);
  ASSERT_EQ(rec.size(), 4u);
  EXPECT_EQ(std::get<bool>(rec[0]), false);
  EXPECT_EQ(std::get<std::int64_t>(rec[1]), 0);
  EXPECT_EQ(std::get<double>(rec[2]), 0.0);
  EXPECT_EQ(std::get<std::complex<double>>(rec[3]), std::complex<double>(0, 0));
  EXPECT_TRUE(m.is_zero(1, 0));
}

TEST(StructuredMatrix, RejectsBadFieldSpecs) {
  EXPECT_THROW(StructuredMatrix(1, 1, {FieldSpec{"a"}, FieldSpec{"a"}}), ValueError);
  EXPECT_THROW(StructuredMatrix(1, 1, {FieldSpec{"", ElementKind::Int}}), ValueError);
  EXPECT_THROW(StructuredMatrix(1, 1, {FieldSpec{"r", ElementKind::Record}}), TypeError);
}

TEST(StructuredMatrix, SetRecordCastsToFieldKinds) {
  StructuredMatrix m(1, 1, {FieldSpec{"weight", ElementKind::Float}, FieldSpec{"cost", ElementKind::Int}});
  std::vector<AttrValue> values = {AttrValue{std::int64_t{2}}, AttrValue{3.7}};
  m.set_record(0, 0, values);
  EXPECT_EQ(std::get<double>(m.field(0, 0, "weight")), 2.0);
  EXPECT_EQ(std::get<std::int64_t>(m.field(0, 0, "cost")), 3);
  EXPECT_THROW((void)m.field(0, 0, "missing"), std::out_of_range);
  std::vector<AttrValue> too_few = {AttrValue{1.0}};
  EXPECT_THROW(m.set_record(0, 0, too_few), std::invalid_argument);
}

TEST(StructuredEncode, DefaultFieldIsFloatWeight) {
  auto g = make_graph(kGraph, 3, {{0, 1, weight(2.0)}, {1, 2, weight(0.5)}});
  auto m = to_structured_matrix(g);
  ASSERT_EQ(m.fields().size(), 1u);
  EXPECT_EQ(std::get<double>(m.field(0, 1, "weight")), 2.0);
  EXPECT_EQ(std::get<double>(m.field(1, 0, "weight")), 2.0);
  EXPECT_EQ(std::get<double>(m.field(2, 1, "weight")), 0.5);
  EXPECT_TRUE(m.is_zero(0, 2));
}

TEST(StructuredEncode, MultipleFieldsInFieldOrder) {
  auto g = make_graph(kDiGraph, 2, {{0, 1, weight_cost(7.0, 5)}});
  StructuredEncodeOptions opts;
  opts.fields = {FieldSpec{"cost", ElementKind::Int}, FieldSpec{"weight", ElementKind::Float}};
  auto m = to_structured_matrix(g, opts);
  auto rec = m.record(0, 1);
  EXPECT_EQ(std::get<std::int64_t>(rec[0]), 5);
  EXPECT_EQ(std::get<double>(rec[1]), 7.0);
  EXPECT_TRUE(m.is_zero(1, 0));
}

TEST(StructuredEncode, MissingAttributeHasNoDefault) {
  auto g = make_graph(kGraph, 2, {{0, 1, AttrMap{}}});
  EXPECT_THROW((void)to_structured_matrix(g), MissingFieldError);
}

TEST(StructuredEncode, MissingAttributeOutsideOrderingIsIgnored) {
  auto g = make_graph(kGraph, 3, {{0, 1, weight(1.0)}, {1, 2, AttrMap{}}});
  StructuredEncodeOptions opts;
  opts.nodelist = std::vector<NodeKey>{key(0), key(1)};
  auto m = to_structured_matrix(g, opts);
  EXPECT_EQ(m.rows(), 2);
  EXPECT_EQ(std::get<double>(m.field(1, 0, "weight")), 1.0);
}

TEST(StructuredEncode, MultigraphIsUnsupported) {
  auto g = make_graph(kMultiGraph, 2, {{0, 1, weight(1.0)}});
  EXPECT_THROW((void)to_structured_matrix(g), UnsupportedForMultigraphError);
}

TEST(StructuredEncode, DuplicateOrderingIsRejected) {
  auto g = make_graph(kGraph, 2, {{0, 1, weight(1.0)}});
  StructuredEncodeOptions opts;
  opts.nodelist = std::vector<NodeKey>{key(1), key(1)};
  EXPECT_THROW((void)to_structured_matrix(g, opts), AmbiguousOrderingError);
}

TEST(StructuredDecode, RestoresEveryField) {
  auto g = make_graph(kDiGraph, 3, {{0, 2, weight_cost(1.5, 4)}, {2, 1, weight_cost(0.0, 9)}});
  StructuredEncodeOptions opts;
  opts.fields = {FieldSpec{"weight", ElementKind::Float}, FieldSpec{"cost", ElementKind::Int}};
  auto m = to_structured_matrix(g, opts);

  DenseDecodeOptions dopts;
  dopts.create_using = kDiGraph;
  auto h = from_structured_matrix(m, dopts);
  EXPECT_EQ(h.number_of_nodes(), 3);
  ASSERT_EQ(h.number_of_edges(), 2);
  auto d02 = h.edge_data(key(0), key(2));
  ASSERT_EQ(d02.size(), 1u);
  EXPECT_EQ(std::get<double>(d02[0].at("weight")), 1.5);
  EXPECT_EQ(std::get<std::int64_t>(d02[0].at("cost")), 4);
  // A zero weight does not hide the edge while another field is non-zero.
  auto d21 = h.edge_data(key(2), key(1));
  ASSERT_EQ(d21.size(), 1u);
  EXPECT_EQ(std::get<std::int64_t>(d21[0].at("cost")), 9);
}

TEST(StructuredDecode, UndirectedMultigraphReadsUpperTriangle) {
  auto g = make_graph(kGraph, 2, {{0, 1, weight(3.0)}});
  auto m = to_structured_matrix(g);
  DenseDecodeOptions dopts;
  dopts.create_using = kMultiGraph;
  auto h = from_structured_matrix(m, dopts);
  EXPECT_EQ(h.number_of_edges(), 1);
}

TEST(StructuredDecode, NonSquareIsRejected) {
  StructuredMatrix m(1, 2, {FieldSpec{"weight"}});
  EXPECT_THROW((void)from_structured_matrix(m), NonSquareMatrixError);
}

TEST(StructuredMatrix, UnsignedFieldRejectsNegativeAndOversizedValues) {
  StructuredMatrix m(1, 1, {FieldSpec{"count", ElementKind::UInt}});
  std::vector<AttrValue> negative = {AttrValue{-3.0}};
  EXPECT_THROW(m.set_record(0, 0, negative), ValueError);
  std::vector<AttrValue> huge = {AttrValue{1e30}};
  EXPECT_THROW(m.set_record(0, 0, huge), ValueError);
  std::vector<AttrValue> ok = {AttrValue{7.0}};
  m.set_record(0, 0, ok);
  EXPECT_EQ(std::get<std::int64_t>(m.field(0, 0, "count")), 7);
}
