// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "editdist.hpp"
#include "prefix_tree.hpp"

namespace corrector {

  static void decode_lower(ParmString word, Vector<Uni32> & out)
  {
    decode(word, out);
    for (Vector<Uni32>::iterator i = out.begin(); i != out.end(); ++i)
      *i = to_lower(*i);
  }

  static String path_string(const Vector<Uni32> & path)
  {
    if (path.empty()) return String();
    return ccommon::encode(&path[0], &path[0] + path.size());
  }

  PrefixTree::Node::~Node()
  {
    for (Children::iterator i = children.begin(); i != children.end(); ++i)
      delete i->second;
    delete entry;
  }

  PrefixTree::PrefixTree()
    : root_(new Node), size_(0), depluralizer_(0) {}

  PrefixTree::~PrefixTree()
  {
    delete root_;
  }

  PrefixTree::Node * PrefixTree::find_node(ParmString word) const
  {
    Vector<Uni32> chars;
    decode_lower(word, chars);
    Node * n = root_;
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i) {
      Node::Children::const_iterator c = n->children.find(*i);
      if (c == n->children.end()) return 0;
      n = c->second;
    }
    return n;
  }

  PrefixTree::Node * PrefixTree::make_node(ParmString word)
  {
    Vector<Uni32> chars;
    decode_lower(word, chars);
    Node * n = root_;
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i) {
      Node * & child = n->children[*i];
      if (!child) child = new Node;
      n = child;
    }
    return n;
  }

  void PrefixTree::insert(ParmString word, const WordEntry & entry)
  {
    if (word.empty()) return;
    Node * n = make_node(word);
    if (!n->entry) {
      n->entry = new WordEntry(entry);
      ++size_;
    } else if (entry.frequency > n->entry->frequency) {
      *n->entry = entry;
    }
  }

  void PrefixTree::update(ParmString word, const WordEntry & entry)
  {
    if (word.empty()) return;
    Node * n = make_node(word);
    if (!n->entry) {
      n->entry = new WordEntry(entry);
      ++size_;
    } else {
      *n->entry = entry;
    }
  }

  const WordEntry * PrefixTree::lookup(ParmString word) const
  {
    if (word.empty()) return 0;
    Node * n = find_node(word);
    return n ? n->entry : 0;
  }

  void PrefixTree::collect(const Node * n, Vector<Uni32> & path,
                           Vector<WordRef> & out) const
  {
    if (n->entry)
      out.push_back(WordRef(path_string(path), n->entry));
    for (Node::Children::const_iterator i = n->children.begin();
         i != n->children.end(); ++i)
    {
      path.push_back(i->first);
      collect(i->second, path, out);
      path.pop_back();
    }
  }

  void PrefixTree::words_with_prefix(ParmString prefix,
                                     Vector<String> & out) const
  {
    Node * n = find_node(prefix);
    if (!n) return;
    Vector<Uni32> path;
    decode_lower(prefix, path);
    Vector<WordRef> found;
    collect(n, path, found);
    for (Vector<WordRef>::const_iterator i = found.begin(); i != found.end(); ++i)
      out.push_back(i->word);
  }

  void PrefixTree::all_words(Vector<WordRef> & out) const
  {
    Vector<Uni32> path;
    out.reserve(out.size() + size_);
    collect(root_, path, out);
  }

  //
  // bounded search
  //

  void PrefixTree::search(const Node * n, const Vector<Uni32> & word,
                          const Vector<int> & prev, int max_distance,
                          Vector<Uni32> & path, SearchResults & out) const
  {
    Vector<int> row;
    for (Node::Children::const_iterator i = n->children.begin();
         i != n->children.end(); ++i)
    {
      int least = edit_distance_next_row(prev, i->first, word, row);
      path.push_back(i->first);
      const Node * child = i->second;
      int dist = row[word.size()];
      if (child->entry && dist <= max_distance)
        out.push_back(SearchResult(path_string(path), child->entry, dist));
      if (least <= max_distance)
        search(child, word, row, max_distance, path, out);
      path.pop_back();
    }
  }

  void PrefixTree::bounded_search(ParmString word, int max_distance,
                                  SearchResults & out) const
  {
    if (max_distance < 0) return;
    Vector<Uni32> w;
    decode_lower(word, w);
    Vector<int> row(w.size() + 1);
    for (unsigned int j = 0; j <= w.size(); ++j)
      row[j] = j;
    Vector<Uni32> path;
    search(root_, w, row, max_distance, path, out);
  }

  //
  // plurals
  //

  bool PrefixTree::derive_plural_info(ParmString word, WordEntry & out) const
  {
    if (!depluralizer_ || word.empty()) return false;
    String w = to_lower(word);
    if (!w.suffix("s") || contains(w)) return false;

    Vector<String> candidates;
    depluralizer_(w, candidates);
    for (Vector<String>::const_iterator i = candidates.begin();
         i != candidates.end(); ++i)
    {
      const WordEntry * e = lookup(*i);
      if (!e) continue;
      if (e->category != Noun && e->category != Adjective) continue;
      if (e->number == Plural) continue;
      out = *e;
      out.frequency = e->frequency / 2;
      if (out.frequency < 1) out.frequency = 1;
      out.number = Plural;
      return true;
    }
    return false;
  }

}
