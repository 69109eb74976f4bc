// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_prefix_tree__
#define __corrector_prefix_tree__

#include <map>

#include "parm_string.hpp"
#include "string.hpp"
#include "unicode.hpp"
#include "vector.hpp"
#include "wordinfo.hpp"

namespace corrector {

  using namespace ccommon;

  // Fills in the candidate singular forms of a plural word, most
  // likely candidate first.  The candidates are not checked against
  // any dictionary.
  typedef void (*Depluralizer)(ParmString word, Vector<String> & candidates);

  struct WordRef {
    String word;
    const WordEntry * entry;
    WordRef() : entry(0) {}
    WordRef(const String & w, const WordEntry * e) : word(w), entry(e) {}
  };

  struct SearchResult {
    String word;
    const WordEntry * entry;
    int distance;
    SearchResult() : entry(0), distance(0) {}
    SearchResult(const String & w, const WordEntry * e, int d)
      : word(w), entry(e), distance(d) {}
  };

  typedef Vector<SearchResult> SearchResults;

  // A character tree over lower case code points.  Every node that
  // ends a word owns exactly one entry.
  class PrefixTree {
  public:
    PrefixTree();
    ~PrefixTree();

    // Keeps an existing entry unless the new one is strictly more
    // frequent.  An empty word is ignored.
    void insert(ParmString word, const WordEntry & entry);
    // Always replaces an existing entry.
    void update(ParmString word, const WordEntry & entry);

    bool contains(ParmString word) const {return lookup(word) != 0;}
    // returns null if the word is not present
    const WordEntry * lookup(ParmString word) const;

    void words_with_prefix(ParmString prefix, Vector<String> & out) const;

    // Every word within max_distance edits of word.  Branches whose
    // best possible distance already exceeds max_distance are not
    // visited.
    void bounded_search(ParmString word, int max_distance,
                        SearchResults & out) const;

    void set_depluralizer(Depluralizer d) {depluralizer_ = d;}
    bool have_depluralizer() const {return depluralizer_ != 0;}

    // Synthesizes the entry of a plural form absent from the tree
    // from its singular noun or adjective.  Returns false if no
    // depluralizer is set or no singular qualifies.
    bool derive_plural_info(ParmString word, WordEntry & out) const;

    unsigned int size() const {return size_;}
    bool empty() const {return size_ == 0;}

    void all_words(Vector<WordRef> & out) const;

  private:
    struct Node {
      typedef std::map<Uni32, Node *> Children;
      Children children;
      WordEntry * entry;
      Node() : entry(0) {}
      ~Node();
    private:
      Node(const Node &);
      void operator=(const Node &);
    };

    Node * find_node(ParmString word) const;
    Node * make_node(ParmString word);
    void collect(const Node * n, Vector<Uni32> & path,
                 Vector<WordRef> & out) const;
    void search(const Node * n, const Vector<Uni32> & word,
                const Vector<int> & row, int max_distance,
                Vector<Uni32> & path, SearchResults & out) const;

    Node * root_;
    unsigned int size_;
    Depluralizer depluralizer_;

    PrefixTree(const PrefixTree &);
    void operator=(const PrefixTree &);
  };

}

#endif
