#include <gtest/gtest.h>
#include "graphconv/core/dense_codec.hpp"
#include "graphconv/core/sparse_codec.hpp"

using namespace graphconv::core;

TEST(GraphSmoke, DenseAndSparseAgree) {
  Graph g(kDiGraph);
  (void)g.add_edge(NodeKey{std::int64_t{0}}, NodeKey{std::int64_t{1}}, AttrMap{{"weight", AttrValue{1.0}}});
  (void)g.add_edge(NodeKey{std::int64_t{1}}, NodeKey{std::int64_t{2}}, AttrMap{{"weight", AttrValue{2.0}}});
  auto dense = to_dense_matrix<double>(g);
  auto sparse = to_dense(to_sparse_matrix<double>(g));
  EXPECT_EQ(g.number_of_nodes(), 3);
  EXPECT_EQ(g.number_of_edges(), 2);
  ASSERT_EQ(dense.rows(), sparse.rows());
  for (Index i = 0; i < dense.rows(); ++i) {
    for (Index j = 0; j < dense.cols(); ++j) EXPECT_EQ(dense.at(i, j), sparse.at(i, j));
  }
}
