// Copyright 2026 DeepMind Technologies Limited
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Tests for xml/xml_merge.cc.

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "tinyxml2.h"
#include "src/xml/xml_merge.h"
#include "src/xml/xml_util.h"
#include "test/fixture.h"

namespace urdf2mjcf {
namespace {

using XMLMergeTest = Urdf2MjcfTest;

TEST_F(XMLMergeTest, EquivalentComparesTagAttributesAndText) {
  tinyxml2::XMLDocument doc;
  const XMLElement* root = ParseElement(&doc, R"(
    <r>
      <a x="1" y="2"> t </a>
      <a y="2" x="1">t</a>
      <a x="1" y="2">u</a>
      <b x="1" y="2">t</b>
    </r>)");
  ASSERT_NE(root, nullptr);
  std::vector<const XMLElement*> c = ChildElements(root);
  EXPECT_TRUE(Equivalent(c[0], c[1]));
  EXPECT_FALSE(Equivalent(c[0], c[2]));
  EXPECT_FALSE(Equivalent(c[0], c[3]));
}

TEST_F(XMLMergeTest, EmptyInputGivesNull) {
  tinyxml2::XMLDocument owner;
  EXPECT_EQ(MergeFragments({}, &owner), nullptr);
}

TEST_F(XMLMergeTest, SingleFragmentIsDeepCopied) {
  tinyxml2::XMLDocument source;
  const XMLElement* fragment =
      ParseElement(&source, R"(<mujoco><compiler angle="radian"/></mujoco>)");
  ASSERT_NE(fragment, nullptr);

  tinyxml2::XMLDocument owner;
  XMLElement* merged = MergeFragments({fragment}, &owner);
  ASSERT_NE(merged, nullptr);
  EXPECT_NE(merged, fragment);
  EXPECT_EQ(merged->GetDocument(), &owner);
  EXPECT_EQ(PrintElement(merged), PrintElement(fragment));
}

TEST_F(XMLMergeTest, DistinctChildrenAreUnited) {
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, R"(<mujoco><compiler angle="radian"/></mujoco>)");
  const XMLElement* second = ParseElement(&b, R"(<mujoco><option timestep="0.001"/></mujoco>)");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  XMLElement* merged = MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(merged),
            R"(<mujoco><compiler angle="radian"/><option timestep="0.001"/></mujoco>)");
}

TEST_F(XMLMergeTest, EquivalentChildrenMergeRecursivelyInPlace) {
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, R"(
    <mujoco>
      <default><joint damping="1"/></default>
      <option/>
    </mujoco>)");
  const XMLElement* second = ParseElement(&b, R"(
    <mujoco>
      <default><geom class="visual"/></default>
    </mujoco>)");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  XMLElement* merged = MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(merged),
            R"(<mujoco><default><joint damping="1"/><geom class="visual"/></default>)"
            R"(<option/></mujoco>)");
}

TEST_F(XMLMergeTest, EquivalentLeavesAreNotDuplicated) {
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, R"(<mujoco><compiler angle="radian"/></mujoco>)");
  const XMLElement* second = ParseElement(&b, R"(<mujoco><compiler angle="radian"/></mujoco>)");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  XMLElement* merged = MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(merged), R"(<mujoco><compiler angle="radian"/></mujoco>)");
}

TEST_F(XMLMergeTest, DifferentAttributesAreNotMerged) {
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, R"(<mujoco><body name="a"><x/></body></mujoco>)");
  const XMLElement* second = ParseElement(&b, R"(<mujoco><body name="b"><y/></body></mujoco>)");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  XMLElement* merged = MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(merged),
            R"(<mujoco><body name="a"><x/></body><body name="b"><y/></body></mujoco>)");
}

TEST_F(XMLMergeTest, MergingIdenticalFragmentsIsIdempotent) {
  static constexpr char kFragment[] = R"(
    <mujoco>
      <default><joint damping="1"/><geom class="visual"/></default>
      <sensor><touch site="s"/></sensor>
    </mujoco>)";
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, kFragment);
  const XMLElement* second = ParseElement(&b, kFragment);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  XMLElement* merged = MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(merged), PrintElement(first));
}

TEST_F(XMLMergeTest, SourcesAreUnchanged) {
  tinyxml2::XMLDocument a, b, owner;
  const XMLElement* first = ParseElement(&a, R"(<mujoco><default><x/></default></mujoco>)");
  const XMLElement* second = ParseElement(&b, R"(<mujoco><default><y/></default></mujoco>)");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  MergeFragments({first, second}, &owner);
  EXPECT_EQ(PrintElement(first), R"(<mujoco><default><x/></default></mujoco>)");
  EXPECT_EQ(PrintElement(second), R"(<mujoco><default><y/></default></mujoco>)");
}

}  // namespace
}  // namespace urdf2mjcf
