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

// Tests for xml/xml_inject.cc.

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "tinyxml2.h"
#include "src/xml/xml_document.h"
#include "src/xml/xml_inject.h"
#include "src/xml/xml_match.h"
#include "src/xml/xml_util.h"
#include "test/fixture.h"

namespace urdf2mjcf {
namespace {

using ::testing::ElementsAre;
using ::testing::IsNull;
using ::testing::StrEq;

static constexpr char kModel[] = R"(
  <mujoco model="robot">
    <compiler angle="radian"/>
    <worldbody>
      <body name="base" childclass="leg">
        <joint name="left_hip" type="hinge"/>
        <geom name="base_visual" class="visual"/>
        <body name="thigh" childclass="leg">
          <joint name="left_knee" type="hinge"/>
          <joint name="right_knee" type="hinge"/>
        </body>
      </body>
    </worldbody>
    <actuator/>
  </mujoco>)";

// the model above, plus a parsed annotation block
class InjectTest : public Urdf2MjcfTest {
 protected:
  InjectTest() : doc_(kModel), injector_(&doc_) {}

  // parse `<mujoco>...</mujoco>` and inject its children
  void Inject(std::string_view annotations) {
    const XMLElement* holder = ParseElement(&annotations_, annotations);
    ASSERT_NE(holder, nullptr);
    injector_.Inject(ChildElements(holder));
  }

  // the only element with this tag and name
  XMLElement* Named(const char* tag, const char* name) {
    std::vector<XMLElement*> found = FindMatches(doc_.Root(), tag, {{"name", name}});
    EXPECT_EQ(found.size(), 1) << tag << " " << name;
    return found.empty() ? nullptr : found.front();
  }

  Document doc_;
  Injector injector_;
  tinyxml2::XMLDocument annotations_;
};

// ------------------------------- dispatch -----------------------------------

TEST_F(InjectTest, SubtreeHasOperations) {
  tinyxml2::XMLDocument xml;
  const XMLElement* root = ParseElement(&xml, R"(
    <worldbody inject_attr="a='1'">
      <body><geom/></body>
      <body><geom replace_attrs="b='2'"/></body>
    </worldbody>)");
  ASSERT_NE(root, nullptr);
  std::vector<const XMLElement*> bodies = ChildElements(root);
  EXPECT_TRUE(SubtreeHasOperations(root));
  EXPECT_FALSE(SubtreeHasOperations(bodies[0]));
  EXPECT_TRUE(SubtreeHasOperations(bodies[1]));
  EXPECT_FALSE(SubtreeHasOperations(bodies[1]->FirstChildElement()));
}

TEST_F(InjectTest, VisitClassifiesFragments) {
  tinyxml2::XMLDocument xml;
  const XMLElement* root = ParseElement(&xml, R"(
    <mujoco>
      <default><joint damping="1"/></default>
      <worldbody><body name="base" inject_attr="gravcomp='1'"/></worldbody>
      <body inject_children="name='thigh'"><site name="s"/></body>
    </mujoco>)");
  ASSERT_NE(root, nullptr);
  std::vector<const XMLElement*> fragments = ChildElements(root);

  EXPECT_TRUE(std::holds_alternative<Fallback>(injector_.Visit(fragments[0], nullptr)));

  DispatchStep step = injector_.Visit(fragments[1], nullptr);
  ASSERT_TRUE(std::holds_alternative<Recurse>(step));
  EXPECT_THAT(std::get<Recurse>(step).parents, ElementsAre(doc_.Find(Section::kWorldbody)));

  step = injector_.Visit(fragments[2], nullptr);
  ASSERT_TRUE(std::holds_alternative<Consumed>(step));
  EXPECT_FALSE(std::get<Consumed>(step).descend);
}

TEST_F(InjectTest, NothingToInjectWarns) {
  injector_.Inject({});
  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "No custom MJCF elements found to inject."));
  EXPECT_EQ(injector_.stats().fragments, 0);
}

// ------------------------------- attribute operations -----------------------

TEST_F(InjectTest, CreatesMissingSectionBeforeWorldbody) {
  Inject(R"(<mujoco><sensor inject_attr="rate='100' noise='0.01'"/></mujoco>)");

  EXPECT_THAT(ChildTags(doc_.Root()), ElementsAre("compiler", "sensor", "worldbody", "actuator"));
  EXPECT_EQ(PrintElement(doc_.FindSection("sensor")), R"(<sensor rate="100" noise="0.01"/>)");
  EXPECT_EQ(injector_.stats().created, 1);
  EXPECT_EQ(WarningCount(), 0);
}

TEST_F(InjectTest, WildcardInjectReachesEveryMatch) {
  Inject(R"(<mujoco><joint name="*_knee" inject_attr="damping='1'"/></mujoco>)");

  EXPECT_THAT(Named("joint", "left_knee")->Attribute("damping"), StrEq("1"));
  EXPECT_THAT(Named("joint", "right_knee")->Attribute("damping"), StrEq("1"));
  EXPECT_THAT(Named("joint", "left_hip")->Attribute("damping"), IsNull());
  EXPECT_EQ(injector_.stats().operations, 2);
  EXPECT_EQ(injector_.stats().created, 0);
}

TEST_F(InjectTest, ConditionalReplaceThroughMatchAttributes) {
  Inject(R"(<mujoco>
    <geom class="visual" replace_attrs="class='visual':class='collision' group='3'"/>
  </mujoco>)");

  XMLElement* geom = Named("geom", "base_visual");
  EXPECT_THAT(geom->Attribute("class"), StrEq("collision"));
  EXPECT_THAT(geom->Attribute("group"), StrEq("3"));
}

TEST_F(InjectTest, ConditionalReplaceWithoutMatchAttributes) {
  Inject(R"(<mujoco>
    <geom replace_attrs="class='visual':class='collision'"/>
  </mujoco>)");

  EXPECT_THAT(Named("geom", "base_visual")->Attribute("class"), StrEq("collision"));
  EXPECT_EQ(injector_.stats().unmatched, 0);
  EXPECT_EQ(WarningCount(), 0);
}

TEST_F(InjectTest, ReplaceWithoutTargetDoesNotCreate) {
  Inject(R"(<mujoco><geom name="missing" replace_attrs="rgba='1 1 1 1'"/></mujoco>)");

  EXPECT_TRUE(log_.Contains(LogLevel::kWarning,
                            "No matching elements found for custom operations pattern"));
  EXPECT_EQ(FindMatches(doc_.Root(), "geom", {}).size(), 1);
  EXPECT_EQ(injector_.stats().unmatched, 1);
  EXPECT_EQ(injector_.stats().created, 0);
}

TEST_F(InjectTest, UnparseableOperationsAreDropped) {
  Inject(R"(<mujoco><geom name="base_visual" inject_attr="garbage"/></mujoco>)");

  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "Dropping <geom"));
  EXPECT_EQ(PrintElement(Named("geom", "base_visual")),
            R"(<geom name="base_visual" class="visual"/>)");
  EXPECT_EQ(injector_.stats().dropped, 1);
}

// ------------------------------- scoped operations --------------------------

TEST_F(InjectTest, ParentsScopeChildOperations) {
  Inject(R"(<mujoco>
    <worldbody>
      <body name="thigh">
        <site name="knee_site"/>
        <joint name="*" inject_attr="armature='0.1'"/>
      </body>
    </worldbody>
  </mujoco>)");

  EXPECT_THAT(Named("joint", "left_knee")->Attribute("armature"), StrEq("0.1"));
  EXPECT_THAT(Named("joint", "right_knee")->Attribute("armature"), StrEq("0.1"));
  EXPECT_THAT(Named("joint", "left_hip")->Attribute("armature"), IsNull());
  EXPECT_THAT(ChildTags(Named("body", "thigh")), ElementsAre("joint", "joint", "site"));
  EXPECT_EQ(injector_.stats().copied, 1);
  EXPECT_EQ(injector_.stats().operations, 2);
}

TEST_F(InjectTest, ScopedOperationWithoutAttributesReachesEveryMatch) {
  Inject(R"(<mujoco>
    <body name="thigh"><joint inject_attr="damping='1'"/></body>
  </mujoco>)");

  EXPECT_THAT(Named("joint", "left_knee")->Attribute("damping"), StrEq("1"));
  EXPECT_THAT(Named("joint", "right_knee")->Attribute("damping"), StrEq("1"));
  EXPECT_THAT(Named("joint", "left_hip")->Attribute("damping"), IsNull());
  EXPECT_EQ(injector_.stats().operations, 2);
  EXPECT_EQ(injector_.stats().created, 0);
}

TEST_F(InjectTest, OperationFragmentChildrenShareItsContext) {
  Inject(R"(<mujoco>
    <body name="base">
      <body name="thigh" inject_attr="gravcomp='1'">
        <joint name="left_knee" inject_attr="armature='0.2'"/>
        <geom name="thigh_geom" size="0.1"/>
      </body>
    </body>
  </mujoco>)");

  XMLElement* base = Named("body", "base");
  XMLElement* thigh = Named("body", "thigh");
  EXPECT_THAT(thigh->Attribute("gravcomp"), StrEq("1"));
  EXPECT_THAT(Named("joint", "left_knee")->Attribute("armature"), StrEq("0.2"));
  EXPECT_THAT(Named("joint", "right_knee")->Attribute("armature"), IsNull());

  // the plain child lands in the enclosing scope, not in the matched body
  EXPECT_THAT(ChildTags(thigh), ElementsAre("joint", "joint"));
  EXPECT_THAT(ChildTags(base), ElementsAre("joint", "geom", "body", "geom"));
  EXPECT_EQ(PrintElement(base->LastChildElement()), R"(<geom name="thigh_geom" size="0.1"/>)");
  EXPECT_EQ(injector_.stats().created, 1);
}

TEST_F(InjectTest, ScopedInjectCreatesInsideParent) {
  Inject(R"(<mujoco>
    <body name="thigh">
      <site name="imu" inject_attr="size='0.01'"/>
    </body>
  </mujoco>)");

  XMLElement* thigh = Named("body", "thigh");
  EXPECT_EQ(PrintElement(thigh->LastChildElement()), R"(<site name="imu" size="0.01"/>)");
  EXPECT_EQ(injector_.stats().created, 1);
}

TEST_F(InjectTest, UnmatchedParentWarns) {
  Inject(R"(<mujoco>
    <body name="missing"><geom inject_attr="rgba='1 0 0 1'"/></body>
  </mujoco>)");

  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "No matching parent element found"));
  EXPECT_EQ(WarningCount(), 1);
  EXPECT_EQ(injector_.stats().unmatched, 1);
  EXPECT_EQ(injector_.stats().created, 0);
}

// ------------------------------- inject children ----------------------------

TEST_F(InjectTest, InjectChildrenIntoEveryMatch) {
  Inject(R"(<mujoco>
    <body inject_children="childclass='leg'"><site name="marker"/></body>
  </mujoco>)");

  EXPECT_EQ(FindMatches(doc_.Root(), "site", {{"name", "marker"}}).size(), 2);
  EXPECT_THAT(ChildTags(Named("body", "thigh")), ElementsAre("joint", "joint", "site"));
  EXPECT_EQ(injector_.stats().operations, 2);
}

TEST_F(InjectTest, InjectChildrenMatchesValuesLiterally) {
  Inject(R"(<mujoco>
    <body inject_children="name='*'"><site name="marker"/></body>
  </mujoco>)");

  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "No matching <body> elements found"));
  EXPECT_TRUE(FindMatches(doc_.Root(), "site", {}).empty());
  EXPECT_EQ(injector_.stats().operations, 0);
}

TEST_F(InjectTest, InjectChildrenIgnoresOtherOperations) {
  Inject(R"(<mujoco>
    <body inject_children="name='thigh'" inject_attr="gravcomp='1'"><site name="s"/></body>
  </mujoco>)");

  XMLElement* thigh = Named("body", "thigh");
  EXPECT_THAT(thigh->Attribute("gravcomp"), IsNull());
  EXPECT_THAT(ChildTags(thigh), ElementsAre("joint", "joint", "site"));
  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "Ignoring other operations"));
}

TEST_F(InjectTest, InjectChildrenWithoutMatchWarns) {
  Inject(R"(<mujoco>
    <body inject_children="name='shin'"><site name="s"/></body>
  </mujoco>)");

  EXPECT_TRUE(log_.Contains(LogLevel::kWarning, "No matching <body> elements found"));
  EXPECT_TRUE(FindMatches(doc_.Root(), "site", {}).empty());
}

// ------------------------------- plain injection ----------------------------

TEST_F(InjectTest, PlainFragmentsCreateThenExtendSections) {
  Inject(R"(<mujoco>
    <default><joint damping="0.5"/></default>
    <default><geom contype="0"/></default>
  </mujoco>)");

  EXPECT_THAT(ChildTags(doc_.Root()),
              ElementsAre("compiler", "default", "worldbody", "actuator"));
  EXPECT_THAT(ChildTags(doc_.FindSection("default")), ElementsAre("joint", "geom"));
  EXPECT_EQ(injector_.stats().fragments, 2);
  EXPECT_EQ(injector_.stats().created, 1);
  EXPECT_EQ(injector_.stats().copied, 2);
}

TEST_F(InjectTest, PlainFragmentWithAttributesExtendsMatch) {
  Inject(R"(<mujoco><body name="base"><site name="imu"/></body></mujoco>)");

  EXPECT_THAT(ChildTags(Named("body", "base")), ElementsAre("joint", "geom", "body", "site"));
  EXPECT_EQ(FindMatches(doc_.Root(), "body", {}).size(), 2);
}

TEST_F(InjectTest, FragmentsAreNotModified) {
  static constexpr char kAnnotations[] =
      R"(<mujoco><joint name="*_knee" inject_attr="damping='1'"/></mujoco>)";
  tinyxml2::XMLDocument pristine;
  std::string expected = PrintElement(ParseElement(&pristine, kAnnotations));
  Inject(kAnnotations);
  EXPECT_EQ(PrintElement(annotations_.RootElement()), expected);
}

}  // namespace
}  // namespace urdf2mjcf
