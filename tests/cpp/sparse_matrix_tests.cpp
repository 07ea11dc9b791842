#include <gtest/gtest.h>
#include "graphconv/core/error.hpp"
#include "graphconv/core/sparse_matrix.hpp"
#include "test_utils.hpp"

using namespace graphconv::core;
using namespace graphconv::core::test;

namespace {
// 3x3 with entries (0,2)=1, (1,0)=2, (2,1)=3, (0,2)=4 duplicated.
CooMatrix<double> sample_coo() {
  return CooMatrix<double>{3, 3, {0, 1, 2, 0}, {2, 0, 1, 2}, {1.0, 2.0, 3.0, 4.0}};
}
} // namespace

TEST(SparseMatrix, FormatAndShapeOfEachLayout) {
  SparseMatrix<double> coo = sample_coo();
  EXPECT_EQ(format_of(coo), SparseFormat::Coo);
  EXPECT_EQ(shape_of(coo), (std::pair<Index, Index>{3, 3}));
  for (auto f : {SparseFormat::Csr, SparseFormat::Csc, SparseFormat::Dok, SparseFormat::Lil}) {
    auto m = as_format(coo, f);
    EXPECT_EQ(format_of(m), f) << to_string(f);
    EXPECT_EQ(shape_of(m), (std::pair<Index, Index>{3, 3}));
  }
}

TEST(SparseMatrix, CsrSumsDuplicatesAndSortsIndices) {
  auto m = as_format(SparseMatrix<double>{sample_coo()}, SparseFormat::Csr);
  const auto& csr = std::get<CsrMatrix<double>>(m);
  EXPECT_EQ(csr.indptr, (std::vector<Index>{0, 1, 2, 3}));
  EXPECT_EQ(csr.indices, (std::vector<Index>{2, 0, 1}));
  EXPECT_EQ(csr.data, (std::vector<double>{5.0, 2.0, 3.0}));
}

TEST(SparseMatrix, CscGroupsByColumn) {
  auto m = as_format(SparseMatrix<double>{sample_coo()}, SparseFormat::Csc);
  const auto& csc = std::get<CscMatrix<double>>(m);
  EXPECT_EQ(csc.indptr, (std::vector<Index>{0, 1, 2, 3}));
  EXPECT_EQ(csc.indices, (std::vector<Index>{1, 2, 0}));
  EXPECT_EQ(csc.data, (std::vector<double>{2.0, 3.0, 5.0}));
}

TEST(SparseMatrix, CooToCooKeepsDuplicates) {
  auto m = as_format(SparseMatrix<double>{sample_coo()}, SparseFormat::Coo);
  EXPECT_EQ(std::get<CooMatrix<double>>(m).data.size(), 4u);
}

TEST(SparseMatrix, DokAndLilHoldSummedEntries) {
  SparseMatrix<double> coo = sample_coo();
  auto dok_m = as_format(coo, SparseFormat::Dok);
  const auto& dok = std::get<DokMatrix<double>>(dok_m);
  ASSERT_EQ(dok.entries.size(), 3u);
  EXPECT_EQ(dok.entries.at({0, 2}), 5.0);

  auto lil_m = as_format(coo, SparseFormat::Lil);
  const auto& lil = std::get<LilMatrix<double>>(lil_m);
  ASSERT_EQ(lil.row_cols.size(), 3u);
  EXPECT_EQ(lil.row_cols[0], (std::vector<Index>{2}));
  EXPECT_EQ(lil.row_data[0], (std::vector<double>{5.0}));
  EXPECT_EQ(lil.row_cols[2], (std::vector<Index>{1}));
}

TEST(SparseMatrix, LilConvertsThroughCoo) {
  LilMatrix<std::int64_t> lil{2, 3, {{0, 2}, {1}}, {{7, 8}, {9}}};
  auto coo = to_coo(lil);
  EXPECT_EQ(coo.row, (std::vector<Index>{0, 0, 1}));
  EXPECT_EQ(coo.col, (std::vector<Index>{0, 2, 1}));
  EXPECT_EQ(coo.data, (std::vector<std::int64_t>{7, 8, 9}));

  auto triples = sparse_triples(SparseMatrix<std::int64_t>{lil});
  ASSERT_EQ(triples.size(), 3u);
  EXPECT_EQ(triples[1].col, 2);
  EXPECT_EQ(triples[1].value, 8);
}

TEST(SparseMatrix, ToDenseSumsDuplicates) {
  auto d = to_dense(SparseMatrix<double>{sample_coo()});
  expect_matrix_eq<double>(d, {{0, 0, 5}, {2, 0, 0}, {0, 3, 0}});
}

TEST(SparseMatrix, ForEachTripleWalksCsrByRow) {
  CsrMatrix<double> csr{2, 2, {0, 1, 2}, {1, 0}, {4.0, 6.0}};
  std::vector<std::tuple<Index, Index, double>> seen;
  for_each_triple(SparseMatrix<double>{csr}, [&](Index r, Index c, double v) { seen.emplace_back(r, c, v); });
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], std::make_tuple(Index{0}, Index{1}, 4.0));
  EXPECT_EQ(seen[1], std::make_tuple(Index{1}, Index{0}, 6.0));
}

TEST(SparseMatrix, ValidateRejectsMalformedLayouts) {
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{CsrMatrix<double>{2, 2, {0, 1}, {0}, {1.0}}}),
               std::invalid_argument);
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{CsrMatrix<double>{2, 2, {0, 2, 1}, {0}, {1.0}}}),
               std::invalid_argument);
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{CsrMatrix<double>{1, 1, {0, 1}, {3}, {1.0}}}),
               std::out_of_range);
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{CooMatrix<double>{2, 2, {0, 1}, {0}, {1.0, 2.0}}}),
               std::invalid_argument);
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{CooMatrix<double>{2, 2, {2}, {0}, {1.0}}}),
               std::out_of_range);
  DokMatrix<double> dok{2, 2, {}};
  dok.entries[{-1, 0}] = 1.0;
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{dok}), std::out_of_range);
  EXPECT_THROW(validate_sparse(SparseMatrix<double>{LilMatrix<double>{2, 2, {{0}}, {{1.0}}}}),
               std::invalid_argument);
  EXPECT_NO_THROW(validate_sparse(SparseMatrix<double>{sample_coo()}));
}

TEST(SparseMatrix, FormatNamesParse) {
  for (auto f : {SparseFormat::Csr, SparseFormat::Csc, SparseFormat::Coo, SparseFormat::Dok, SparseFormat::Lil}) {
    EXPECT_EQ(parse_sparse_format(to_string(f)), f);
  }
  EXPECT_EQ(parse_sparse_format("lil"), SparseFormat::Lil);
  EXPECT_THROW((void)parse_sparse_format("bsr"), UnknownFormatError);
  EXPECT_THROW((void)parse_sparse_format("CSR"), UnknownFormatError);
}
